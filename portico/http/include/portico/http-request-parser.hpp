#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "portico/http-request.hpp"
#include "portico/http-status-code.hpp"

namespace portico {

struct ParserLimits {
  std::size_t maxHeaderBytes{1UL << 20};
  std::size_t maxBodyBytes{64UL << 20};
};

// Outcome of an attempt to parse one HTTP/1.x request from the head of a receive buffer.
struct ParseResult {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  Status status{Status::NeedMore};
  // Status code to answer with when status is Error (400, 413, 431, 501, 505).
  http::StatusCode errorCode{0};
  // Number of bytes of the buffer making up the request, when Complete.
  std::size_t consumed{0};
  // True as soon as the header block has been fully received (even if the body is still incomplete).
  bool headersComplete{false};
  // True if the headers are complete, the body is not and the client sent "Expect: 100-continue".
  bool expectContinue{false};
};

// Resume point of a chunked body that is still being received, kept by the caller between calls
// on the same growing buffer. Reset it when the request is consumed or the buffer is discarded.
struct ChunkedProgress {
  // Offset, relative to the start of the body, just after the last complete chunk.
  std::size_t offset{0};
  // Sum of the sizes of the chunks before offset.
  std::size_t bodySize{0};
};

// Parses the first request contained in 'data' into 'request'.
// Call it again with the grown buffer while it returns NeedMore. When 'chunkedProgress' is given, a chunked
// body is not rescanned from its start at each call, which keeps large chunked uploads linear.
// Leading empty lines before the request line are ignored (RFC 9112 §2.2).
ParseResult ParseHttpRequest(std::string_view data, const ParserLimits& limits, HttpRequest& request,
                             ChunkedProgress* chunkedProgress = nullptr);

}  // namespace portico
