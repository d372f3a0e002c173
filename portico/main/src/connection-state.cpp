#include "portico/internal/connection-state.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "portico/socket.hpp"
#include "portico/timedef.hpp"
#include "portico/transport.hpp"

namespace portico::internal {

ConnectionState::ConnectionState(Socket sock, std::unique_ptr<ITransport> transportPtr, SteadyTimePoint now) noexcept
    : socket(std::move(sock)),
      transport(std::move(transportPtr)),
      tlsTransport(dynamic_cast<TlsTransport*>(transport.get())),
      acceptTp(now),
      lastActivity(now),
      tlsEstablished(tlsTransport == nullptr) {}

ITransport::TransportResult ConnectionState::transportRead(std::size_t chunkSize) {
  const auto oldSize = inBuffer.size();
  inBuffer.resize(oldSize + chunkSize);
  const auto res = transport->read(inBuffer.data() + oldSize, chunkSize);
  inBuffer.resize(oldSize + res.bytesProcessed);
  return res;
}

ITransport::TransportResult ConnectionState::transportWrite() {
  const auto res = transport->write(pendingOutput());
  outOffset += res.bytesProcessed;
  if (!hasPendingOutput()) {
    outBuffer.clear();
    outOffset = 0;
    writeStartTp = {};
  }
  return res;
}

std::string& ConnectionState::prepareOutput(SteadyTimePoint now) noexcept {
  if (!hasPendingOutput()) {
    writeStartTp = now;
  }
  return outBuffer;
}

}  // namespace portico::internal
