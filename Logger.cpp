#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <pwd.h>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace foldermon {

Logger::Logger(const std::string &logPath) : Logger(logPath, std::cout) {}

Logger::Logger(const std::string &logPath, std::ostream &console)
    : logFilePath(logPath), console(console) {
  out.open(logFilePath, std::ios::out | std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("cannot open log file: " + logFilePath);
  }
}

void Logger::info(const std::string &message) {
  write(baseRecord("info", message));
}

void Logger::error(const std::string &message) {
  write(baseRecord("error", message));
}

void Logger::fatal(const std::string &message) {
  write(baseRecord("fatal", message));
  std::exit(EXIT_FAILURE);
}

void Logger::logEvent(const std::string &action, const std::string &filePath,
                      const std::string &message) {
  json j = baseRecord("info", message);
  j["file_event"] = action;
  j["file_path"] = filePath;

  std::string name = filePath.substr(filePath.find_last_of('/') + 1);
  std::string ext = name.find('.') != std::string::npos
                        ? name.substr(name.find_last_of('.') + 1)
                        : "";
  j["file_name"] = name;
  j["file_extension"] = ext;

  // The file may already be gone (deleted by retention, or a short-lived
  // temp file), in which case the stat fields are left out.
  struct stat sb{};
  if (stat(filePath.c_str(), &sb) == 0) {
    j["file_size"] = sb.st_size;
    j["file_owner"] = getUsername(sb.st_uid);
    j["file_permissions"] = getPermissions(sb.st_mode);
  }

  write(j);
}

json Logger::baseRecord(const char *level, const std::string &message) {
  json j;
  j["timestamp"] = getTimestamp();
  j["level"] = level;
  j["message"] = message;
  j["asset"] = getHostname();
  j["process_id"] = std::to_string(getpid());
  return j;
}

void Logger::write(const json &record) {
  const std::string line =
      record.dump(-1, ' ', false, json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(writeMutex);
  console << line << std::endl;
  out << line << std::endl;
}

std::string Logger::getTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto itt = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;
  struct tm tm{};
  gmtime_r(&itt, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0')
      << std::setw(3) << millis.count() << 'Z';
  return oss.str();
}

std::string Logger::getUsername(uid_t uid) {
  struct passwd pwd{};
  struct passwd *result = nullptr;
  char buffer[1024];
  if (getpwuid_r(uid, &pwd, buffer, sizeof(buffer), &result) == 0 && result) {
    return std::string(result->pw_name);
  }
  return std::to_string(uid);
}

std::string Logger::getPermissions(mode_t mode) {
  std::string perms = "---------";
  perms[0] = (mode & S_IRUSR) ? 'r' : '-';
  perms[1] = (mode & S_IWUSR) ? 'w' : '-';
  perms[2] = (mode & S_IXUSR) ? 'x' : '-';
  perms[3] = (mode & S_IRGRP) ? 'r' : '-';
  perms[4] = (mode & S_IWGRP) ? 'w' : '-';
  perms[5] = (mode & S_IXGRP) ? 'x' : '-';
  perms[6] = (mode & S_IROTH) ? 'r' : '-';
  perms[7] = (mode & S_IWOTH) ? 'w' : '-';
  perms[8] = (mode & S_IXOTH) ? 'x' : '-';
  return perms;
}

std::string Logger::getHostname() {
  char hostname[256] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
    return "unknown";
  }
  return std::string(hostname);
}

} // namespace foldermon
