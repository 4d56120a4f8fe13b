#ifndef FOLDERMON_LOGGER_HPP
#define FOLDERMON_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <sys/types.h>

namespace foldermon {

// Writes one JSON document per line to stdout and to an append-only file.
// Safe to call from the watcher thread and the main loop at the same time.
class Logger {
public:
  explicit Logger(const std::string &logPath);
  Logger(const std::string &logPath, std::ostream &console);

  void info(const std::string &message);
  void error(const std::string &message);
  [[noreturn]] void fatal(const std::string &message);

  // File-centric line; adds stat details of filePath when it still exists.
  void logEvent(const std::string &action, const std::string &filePath,
                const std::string &message = "");

  const std::string &path() const { return logFilePath; }

private:
  nlohmann::json baseRecord(const char *level, const std::string &message);
  void write(const nlohmann::json &record);

  std::string getTimestamp();
  std::string getUsername(uid_t uid);
  std::string getPermissions(mode_t mode);
  std::string getHostname();

  std::string logFilePath;
  std::ofstream out;
  std::ostream &console;
  std::mutex writeMutex;
};

} // namespace foldermon

#endif // FOLDERMON_LOGGER_HPP
