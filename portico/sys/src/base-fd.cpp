#include "portico/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "portico/log.hpp"

namespace portico {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close() fails with EINTR, so it must not be retried.
  if (::close(_fd) != 0 && errno != EINTR) {
    const auto err = errno;
    log::error("close fd # {} failed: {}", _fd, std::strerror(err));
  } else {
    log::debug("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

}  // namespace portico
