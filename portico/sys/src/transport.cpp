#include "portico/transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

namespace portico {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::read(_fd, buf, len);
    if (nbRead >= 0) {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno == EINTR) {
      continue;
    }
    return {0, errno == EAGAIN ? TransportHint::ReadReady : TransportHint::Error};
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};
  while (ret.bytesProcessed < data.size()) {
    // MSG_NOSIGNAL: a peer that went away must not raise SIGPIPE in the embedding process.
    const auto nbWritten =
        ::send(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, MSG_NOSIGNAL);
    if (nbWritten == -1) {
      if (errno == EINTR) {
        continue;
      }
      ret.want = errno == EAGAIN ? TransportHint::WriteReady : TransportHint::Error;
      break;
    }
    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }
  return ret;
}

}  // namespace portico
