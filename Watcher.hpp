#ifndef FOLDERMON_WATCHER_HPP
#define FOLDERMON_WATCHER_HPP

#include "Logger.hpp"
#include "Notifications.hpp"
#include <atomic>
#include <limits.h>
#include <map>
#include <string>
#include <sys/inotify.h>
#include <thread>

#define FOLDERMON_EVENT_BUF_LEN                                                \
  (1024 * (sizeof(struct inotify_event) + NAME_MAX + 1))

// Only creations trigger a run, so nothing else is subscribed. Writes into
// a file being copied in would otherwise flood the event channel.
#define FOLDERMON_WATCH_MASK IN_CREATE

namespace foldermon {

// Non-recursive inotify subscription. Files created inside subdirectories
// of a watched path are not reported.
class Watcher {
public:
  Watcher(Logger &logger, NotificationQueue &queue);
  ~Watcher();

  Watcher(const Watcher &) = delete;
  Watcher &operator=(const Watcher &) = delete;

  // Throws std::system_error if the path cannot be watched. Call before
  // start(); the reader thread owns the watch table afterwards.
  void watchDirectory(const std::string &path);

  // Starts the reader thread feeding the queue.
  void start();
  // Stops the reader thread and closes both channels.
  void stop();

private:
  void readLoop();
  void dispatchEvent(const struct inotify_event *event);

  Logger &logger;
  NotificationQueue &queue;
  int inotifyFd;
  std::map<int, std::string> wdToPath;
  std::thread reader;
  std::atomic<bool> stopping{false};
};

} // namespace foldermon

#endif // FOLDERMON_WATCHER_HPP
