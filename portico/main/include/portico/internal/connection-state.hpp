#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "portico/http-request-parser.hpp"
#include "portico/socket.hpp"
#include "portico/timedef.hpp"
#include "portico/tls-transport.hpp"
#include "portico/transport.hpp"

namespace portico::internal {

// State of one accepted connection, owned by the reactor that accepted it.
struct ConnectionState {
  ConnectionState(Socket sock, std::unique_ptr<ITransport> transportPtr, SteadyTimePoint now) noexcept;

  // Reads at most chunkSize bytes from the transport, appended to inBuffer.
  ITransport::TransportResult transportRead(std::size_t chunkSize);

  // Writes as much pending output as possible.
  ITransport::TransportResult transportWrite();

  // Returns the buffer to append serialized output to. Starts the write timer if nothing was pending.
  std::string& prepareOutput(SteadyTimePoint now) noexcept;

  [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

  [[nodiscard]] std::string_view pendingOutput() const noexcept {
    return std::string_view(outBuffer).substr(outOffset);
  }

  // True if no request is being received and no response is being sent.
  [[nodiscard]] bool isIdle() const noexcept { return inBuffer.empty() && !hasPendingOutput(); }

  [[nodiscard]] bool isRequestPending() const noexcept { return requestStartTp != SteadyTimePoint{}; }

  [[nodiscard]] bool canCloseNow() const noexcept {
    return closeImmediately || (closeAfterFlush && !hasPendingOutput());
  }

  void requestImmediateClose() noexcept { closeImmediately = true; }

  Socket socket;
  std::unique_ptr<ITransport> transport;
  // Same object as transport for TLS connections, nullptr for plain ones.
  TlsTransport* tlsTransport{nullptr};
  TlsSessionInfo tlsInfo;
  std::string inBuffer;
  // Chunked body scan position of the request at the head of inBuffer.
  ChunkedProgress chunkedProgress;
  std::string outBuffer;
  std::size_t outOffset{0};
  SteadyTimePoint acceptTp;
  SteadyTimePoint lastActivity;
  // First byte of the request being received, zero when none.
  SteadyTimePoint requestStartTp;
  // Time output became pending, zero when none.
  SteadyTimePoint writeStartTp;
  uint32_t nbRequestsServed{0};
  // Always true for plain connections.
  bool tlsEstablished{false};
  bool headersComplete{false};
  bool continueSent{false};
  bool waitingWritable{false};
  bool closeAfterFlush{false};
  bool closeImmediately{false};
};

}  // namespace portico::internal
