#include "Monitor.hpp"
#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace foldermon {

namespace {

using Snapshot =
    std::map<std::string, std::pair<std::uintmax_t, fs::file_time_type>>;

// Sizes and mtimes of everything under root. Entries that vanish between
// listing and stat are left out.
Snapshot takeSnapshot(const fs::path &root) {
  Snapshot snap;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || ec) {
      ec.clear();
      continue;
    }
    std::error_code statEc;
    auto size = fs::file_size(it->path(), statEc);
    auto mtime = fs::last_write_time(it->path(), statEc);
    if (!statEc) {
      snap[it->path().string()] = {size, mtime};
    }
  }
  return snap;
}

} // namespace

Monitor::Monitor(const Config &cfg, Logger &log)
    : config(cfg), logger(log), archiver(cfg, log) {}

int Monitor::run(NotificationQueue &queue) {
  while (true) {
    Notification n = queue.next();
    switch (n.kind) {
    case Notification::Kind::Closed:
      return 0;

    case Notification::Kind::Error:
      logger.error("Watcher error: " + n.error);
      break;

    case Notification::Kind::Event:
      if (n.event.type != EventType::Create) {
        break;
      }
      if (!handleCreate(n.event) && config.exitOnArchiveFailure) {
        return 1;
      }
      break;
    }
  }
}

bool Monitor::handleCreate(const WatchEvent &event) {
  logger.logEvent(eventTypeName(event.type), event.path,
                  "Detected new file: " + event.path);
  waitForSettle();

  try {
    archiver.archiveAndMove(std::chrono::system_clock::now());
  } catch (const std::exception &e) {
    logger.error(std::string("Error during zip and move: ") + e.what());
    return false;
  }
  return true;
}

void Monitor::waitForSettle() {
  std::this_thread::sleep_for(config.debounce);
  if (config.settle != SettleStrategy::SizePolling) {
    return;
  }

  Snapshot previous = takeSnapshot(config.watchFolder);
  for (int polls = 1; polls < config.settleMaxPolls; ++polls) {
    std::this_thread::sleep_for(config.debounce);
    Snapshot current = takeSnapshot(config.watchFolder);
    if (current == previous) {
      return;
    }
    previous = std::move(current);
  }
  logger.info("Watch folder still changing after " +
              std::to_string(config.settleMaxPolls) +
              " polls, archiving anyway");
}

} // namespace foldermon
