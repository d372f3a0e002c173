#pragma once

#include "portico/base-fd.hpp"

namespace portico {

// Non-blocking eventfd used to wake a reactor blocked in epoll_wait from another thread.
class EventFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  EventFd();

  void send() const noexcept;

  // Resets the counter so that the fd stops being readable.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace portico
