#ifndef FOLDERMON_NOTIFICATIONS_HPP
#define FOLDERMON_NOTIFICATIONS_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace foldermon {

enum class EventType { Create, Delete, Modify, MovedFrom, MovedTo, Attrib };

const char *eventTypeName(EventType type);

struct WatchEvent {
  EventType type;
  std::string path;
  bool isDirectory = false;
};

struct Notification {
  enum class Kind { Event, Error, Closed };

  Kind kind = Kind::Closed;
  WatchEvent event{EventType::Create, "", false};
  std::string error;
};

// Two channels, events and errors, filled by the watcher thread and
// drained by a single consumer. next() is a priority-free select: when
// both channels hold items it alternates between them. Closing either
// channel ends the stream once that channel is drained.
class NotificationQueue {
public:
  void pushEvent(WatchEvent event);
  void pushError(std::string message);

  void closeEvents();
  void closeErrors();
  void close();

  // Blocks until an item is ready or a channel is closed and empty.
  Notification next();

private:
  std::mutex mutex;
  std::condition_variable ready;
  std::deque<WatchEvent> events;
  std::deque<std::string> errors;
  bool eventsClosed = false;
  bool errorsClosed = false;
  bool preferErrors = false;
};

} // namespace foldermon

#endif // FOLDERMON_NOTIFICATIONS_HPP
