#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "portico/base-fd.hpp"
#include "portico/event.hpp"
#include "portico/timedef.hpp"

namespace portico {

// RAII wrapper over an epoll instance.
//  * The ready-event buffer starts at kInitialCapacity slots and doubles each time a poll fills it.
//  * add()/mod() report failures through their return value (already logged) so that callers can
//    decide whether to drop a single connection or abort.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct Event {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(Duration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept = default;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept = default;

  ~EventLoop();

  // Throws std::system_error on failure.
  void addOrThrow(int fd, EventBmp eventBmp) const;

  [[nodiscard]] bool add(int fd, EventBmp eventBmp) const;

  [[nodiscard]] bool mod(int fd, EventBmp eventBmp) const;

  void del(int fd) const;

  // Waits up to the poll timeout.
  // Returns the ready events (empty on timeout or EINTR). Throws std::system_error on unrecoverable failure.
  // The returned span stays valid until the next call to poll().
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  std::vector<epoll_event> _epollEvents;
  std::vector<Event> _readyEvents;
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
};

}  // namespace portico
