#include "Watcher.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace foldermon {

namespace {

// Lets the reader thread notice stop() without a wakeup pipe.
constexpr int POLL_TIMEOUT_MS = 200;

} // namespace

Watcher::Watcher(Logger &log, NotificationQueue &q)
    : logger(log), queue(q) {
  inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotifyFd == -1) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }
}

Watcher::~Watcher() {
  stop();
  close(inotifyFd);
}

void Watcher::watchDirectory(const std::string &path) {
  int wd = inotify_add_watch(inotifyFd, path.c_str(),
                             FOLDERMON_WATCH_MASK | IN_ONLYDIR);
  if (wd == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "inotify_add_watch " + path);
  }
  wdToPath[wd] = path;
  logger.info("Watching: " + path);
}

void Watcher::start() {
  if (reader.joinable()) {
    return;
  }
  stopping = false;
  reader = std::thread(&Watcher::readLoop, this);
}

void Watcher::stop() {
  stopping = true;
  if (reader.joinable()) {
    reader.join();
  }
  queue.close();
}

void Watcher::dispatchEvent(const struct inotify_event *event) {
  if (event->mask & IN_Q_OVERFLOW) {
    queue.pushError("inotify event queue overflowed, events were lost");
    return;
  }

  auto it = wdToPath.find(event->wd);
  if (it == wdToPath.end()) {
    return;
  }

  if (event->mask & IN_IGNORED) {
    queue.pushError("watch removed: " + it->second);
    wdToPath.erase(it);
    return;
  }

  std::string file = event->len ? event->name : "";
  std::string fullPath = file.empty() ? it->second : it->second + "/" + file;
  bool isDir = (event->mask & IN_ISDIR) != 0;

  if (event->mask & IN_CREATE) {
    queue.pushEvent({EventType::Create, fullPath, isDir});
  }
}

void Watcher::readLoop() {
  alignas(struct inotify_event) char buffer[FOLDERMON_EVENT_BUF_LEN];

  while (!stopping) {
    struct pollfd pfd{};
    pfd.fd = inotifyFd;
    pfd.events = POLLIN;

    int ready = poll(&pfd, 1, POLL_TIMEOUT_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      queue.pushError(std::string("poll: ") + std::strerror(errno));
      break;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t length = read(inotifyFd, buffer, sizeof(buffer));
    if (length < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      queue.pushError(std::string("read: ") + std::strerror(errno));
      break;
    }

    for (char *ptr = buffer; ptr < buffer + length;) {
      const struct inotify_event *event = (const struct inotify_event *)ptr;
      dispatchEvent(event);
      ptr += sizeof(struct inotify_event) + event->len;
    }
  }

  // An unrecoverable read failure ends the stream; the main loop sees the
  // closed channels and returns.
  if (!stopping) {
    queue.closeEvents();
  }
}

} // namespace foldermon
