#include "Archiver.hpp"
#include "ZipWriter.hpp"
#include <algorithm>
#include <cerrno>
#include <ctime>
#include <fstream>
#include <sys/stat.h>
#include <system_error>
#include <vector>

namespace foldermon {

namespace {

// Depth-first walk in lexical order. Symlinks to directories are not
// followed. Non-regular files (sockets, fifos, dangling links) are skipped.
template <typename Fn>
void walkRegularFiles(const fs::path &dir, Logger &logger, Fn &&onFile) {
  std::vector<fs::directory_entry> children;
  for (const auto &entry : fs::directory_iterator(dir)) {
    children.push_back(entry);
  }
  std::sort(children.begin(), children.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });

  for (const auto &entry : children) {
    fs::file_status linkStatus = entry.symlink_status();
    if (fs::is_directory(linkStatus)) {
      walkRegularFiles(entry.path(), logger, onFile);
    } else if (fs::is_regular_file(entry.status())) {
      onFile(entry.path());
    } else {
      logger.logEvent("skipped", entry.path().string(),
                      "Not a regular file: " + entry.path().string());
    }
  }
}

std::time_t modificationTime(const fs::path &file) {
  struct stat sb{};
  if (stat(file.c_str(), &sb) != 0) {
    throw fs::filesystem_error("stat", file,
                               std::error_code(errno, std::generic_category()));
  }
  return sb.st_mtime;
}

bool sameFile(const fs::path &a, const fs::path &b) {
  std::error_code ec;
  bool same = fs::equivalent(a, b, ec);
  return !ec && same;
}

} // namespace

std::string bundleFileName(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  struct tm tm{};
  localtime_r(&t, &tm);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
  return std::string("backup_") + stamp + ".zip";
}

Archiver::Archiver(const Config &cfg, Logger &log)
    : config(cfg), logger(log) {}

fs::path Archiver::createBundle(std::chrono::system_clock::time_point when) {
  const fs::path root = config.watchFolder;
  const fs::path staging = config.stagingOrBackupFolder();
  fs::create_directories(staging);

  const fs::path bundlePath = staging / bundleFileName(when);
  ZipWriter zip(bundlePath.string());
  logger.info("Zip file path: " + bundlePath.string());

  walkRegularFiles(root, logger, [&](const fs::path &file) {
    if (sameFile(file, bundlePath)) {
      return;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
      throw fs::filesystem_error(
          "cannot open for archiving", file,
          std::error_code(errno ? errno : EIO, std::generic_category()));
    }

    const std::string name = file.lexically_relative(root).generic_string();
    zip.addEntry(name, in, modificationTime(file));
    logger.logEvent("archived", file.string(),
                    "Added to zip: " + file.string());
  });

  zip.close();
  return bundlePath;
}

fs::path Archiver::relocate(const fs::path &bundle) {
  const fs::path dest = fs::path(config.backupFolder) / bundle.filename();

  std::error_code ec;
  fs::rename(bundle, dest, ec);
  if (ec == std::errc::cross_device_link) {
    fs::copy_file(bundle, dest, fs::copy_options::overwrite_existing);
    fs::remove(bundle);
  } else if (ec) {
    throw fs::filesystem_error("cannot move bundle", bundle, dest, ec);
  }

  logger.info("Moved zip to: " + dest.string());
  return dest;
}

std::size_t Archiver::deleteArchivedFiles(const fs::path &keep) {
  std::vector<fs::path> files;
  try {
    walkRegularFiles(config.watchFolder, logger, [&](const fs::path &file) {
      if (keep.empty() || !sameFile(file, keep)) {
        files.push_back(file);
      }
    });
  } catch (const fs::filesystem_error &e) {
    // Whatever was collected before the failure is still removed.
    logger.error(std::string("Error deleting files: ") + e.what());
  }
  return removeFiles(files);
}

std::size_t Archiver::removeFiles(const std::vector<fs::path> &files) {
  std::size_t removed = 0;
  for (const auto &file : files) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
      logger.error("Failed to delete " + file.string() + ": " + ec.message());
      continue;
    }
    ++removed;
    logger.logEvent("deleted", file.string(), "Deleted: " + file.string());
  }
  return removed;
}

fs::path Archiver::archiveAndMove(std::chrono::system_clock::time_point when) {
  fs::path created = createBundle(when);
  fs::path dest = relocate(created);
  if (config.deleteAfterArchive) {
    deleteArchivedFiles(dest);
  }
  return dest;
}

} // namespace foldermon
