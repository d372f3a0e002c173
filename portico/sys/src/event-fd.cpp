#include "portico/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    const auto err = errno;
    // EAGAIN means the counter is saturated, the reader is already going to wake up.
    if (err != EAGAIN) {
      log::error("EventFd # {} write failed: {}", fd(), std::strerror(err));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counter{};
  if (::eventfd_read(fd(), &counter) == -1) {
    const auto err = errno;
    if (err != EAGAIN) {
      log::error("EventFd # {} read failed: {}", fd(), std::strerror(err));
    }
  }
}

}  // namespace portico
