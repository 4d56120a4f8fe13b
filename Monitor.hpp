#ifndef FOLDERMON_MONITOR_HPP
#define FOLDERMON_MONITOR_HPP

#include "Archiver.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Notifications.hpp"

namespace foldermon {

// Single-threaded dispatch loop: one notification at a time, each creation
// event runs settle -> archive -> relocate -> retention to completion
// before the next notification is taken.
class Monitor {
public:
  Monitor(const Config &config, Logger &logger);

  // Returns the process exit status: 0 when the notification stream closes,
  // 1 when an archive run fails and exitOnArchiveFailure is set.
  int run(NotificationQueue &queue);

  // Handles one creation event. Returns false if the archive run failed.
  bool handleCreate(const WatchEvent &event);

private:
  void waitForSettle();

  const Config &config;
  Logger &logger;
  Archiver archiver;
};

} // namespace foldermon

#endif // FOLDERMON_MONITOR_HPP
