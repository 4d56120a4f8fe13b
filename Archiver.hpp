#ifndef FOLDERMON_ARCHIVER_HPP
#define FOLDERMON_ARCHIVER_HPP

#include "Config.hpp"
#include "Logger.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace foldermon {

namespace fs = std::filesystem;

// backup_YYYYMMDD_HHMMSS.zip in local time. Two calls within the same
// second return the same name, so the later bundle replaces the earlier.
std::string bundleFileName(std::chrono::system_clock::time_point when);

class Archiver {
public:
  Archiver(const Config &config, Logger &logger);

  // Zips every regular file under the watch folder into a new bundle in the
  // staging folder and returns its path. Errors propagate as exceptions; a
  // partially written bundle stays on disk.
  fs::path createBundle(std::chrono::system_clock::time_point when);

  // Renames the bundle to its final name inside the backup folder.
  fs::path relocate(const fs::path &bundle);

  // Retention: removes every regular file under the watch folder, keeping
  // directories. Failures are logged per file. Returns the number removed.
  // keep, when set, is spared (a bundle living inside the watch folder).
  std::size_t deleteArchivedFiles(const fs::path &keep = fs::path());

  // Removes each path, logging and skipping the ones that fail. Returns the
  // number removed.
  std::size_t removeFiles(const std::vector<fs::path> &files);

  // createBundle, relocate, then deleteArchivedFiles when enabled.
  fs::path archiveAndMove(std::chrono::system_clock::time_point when);

private:
  const Config &config;
  Logger &logger;
};

} // namespace foldermon

#endif // FOLDERMON_ARCHIVER_HPP
