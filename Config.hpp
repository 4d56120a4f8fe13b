#ifndef FOLDERMON_CONFIG_HPP
#define FOLDERMON_CONFIG_HPP

#include <chrono>
#include <stdexcept>
#include <string>

#define FOLDERMON_CONFIG_FILE "foldermon.json"
#define FOLDERMON_DEFAULT_LOG_FILE "foldermon.log"

namespace foldermon {

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class SettleStrategy { FixedDelay, SizePolling };

struct Config {
  std::string watchFolder;
  std::string backupFolder;
  // Bundles are written here first, then renamed into backupFolder.
  // Empty means backupFolder itself.
  std::string stagingFolder;
  std::string logFilePath = FOLDERMON_DEFAULT_LOG_FILE;

  bool deleteAfterArchive = false;
  bool exitOnArchiveFailure = true;

  std::chrono::milliseconds debounce{1000};
  SettleStrategy settle = SettleStrategy::FixedDelay;
  int settleMaxPolls = 30;

  const std::string &stagingOrBackupFolder() const {
    return stagingFolder.empty() ? backupFolder : stagingFolder;
  }
};

// Reads optional settings from a JSON file. A missing file yields the
// defaults; unreadable JSON or a value of the wrong type throws ConfigError.
Config loadConfig(const std::string &configPath);

// Fills watchFolder and backupFolder from argv. Exactly two positional
// arguments are accepted, otherwise UsageError is thrown.
void resolveFolders(Config &config, int argc, const char *const argv[]);

} // namespace foldermon

#endif // FOLDERMON_CONFIG_HPP
