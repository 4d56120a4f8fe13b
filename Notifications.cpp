#include "Notifications.hpp"
#include <utility>

namespace foldermon {

const char *eventTypeName(EventType type) {
  switch (type) {
  case EventType::Create:
    return "create";
  case EventType::Delete:
    return "delete";
  case EventType::Modify:
    return "modify";
  case EventType::MovedFrom:
    return "moved_from";
  case EventType::MovedTo:
    return "moved_to";
  case EventType::Attrib:
    return "attrib";
  }
  return "other";
}

void NotificationQueue::pushEvent(WatchEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (eventsClosed) {
      return;
    }
    events.push_back(std::move(event));
  }
  ready.notify_one();
}

void NotificationQueue::pushError(std::string message) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (errorsClosed) {
      return;
    }
    errors.push_back(std::move(message));
  }
  ready.notify_one();
}

void NotificationQueue::closeEvents() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    eventsClosed = true;
  }
  ready.notify_all();
}

void NotificationQueue::closeErrors() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    errorsClosed = true;
  }
  ready.notify_all();
}

void NotificationQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    eventsClosed = true;
    errorsClosed = true;
  }
  ready.notify_all();
}

Notification NotificationQueue::next() {
  std::unique_lock<std::mutex> lock(mutex);
  ready.wait(lock, [this] {
    return !events.empty() || !errors.empty() ||
           (eventsClosed && events.empty()) ||
           (errorsClosed && errors.empty());
  });

  Notification n;
  bool takeError = !errors.empty() && (events.empty() || preferErrors);
  if (takeError) {
    n.kind = Notification::Kind::Error;
    n.error = std::move(errors.front());
    errors.pop_front();
    preferErrors = false;
  } else if (!events.empty()) {
    n.kind = Notification::Kind::Event;
    n.event = std::move(events.front());
    events.pop_front();
    preferErrors = true;
  } else {
    n.kind = Notification::Kind::Closed;
  }
  return n;
}

} // namespace foldermon
