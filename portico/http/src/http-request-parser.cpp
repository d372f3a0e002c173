#include "portico/http-request-parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-status-code.hpp"
#include "portico/string-utils.hpp"

namespace portico {

namespace {

// Upper bound of a chunk size line (size + extensions) and of each trailer line.
constexpr std::size_t kMaxChunkLineLen = 4096;

constexpr ParseResult MakeError(http::StatusCode code) noexcept {
  ParseResult result;
  result.status = ParseResult::Status::Error;
  result.errorCode = code;
  return result;
}

// RFC 9110 §5.6.2 token characters
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

constexpr bool IsToken(std::string_view str) noexcept { return !str.empty() && std::ranges::all_of(str, IsTokenChar); }

std::optional<std::size_t> ParseContentLength(std::string_view value) noexcept {
  std::size_t len;
  const auto* end = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), end, len);
  if (value.empty() || errc != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return len;
}

enum class ChunkedStatus : uint8_t { NeedMore, Complete, Malformed, TooLarge };

// Parses a chunk size line (size and optional extensions, without CRLF).
ChunkedStatus ParseChunkSize(std::string_view line, std::size_t& chunkSize) noexcept {
  const auto sizeStr = TrimOws(line.substr(0, line.find(';')));
  const auto* sizeEnd = sizeStr.data() + sizeStr.size();
  const auto [ptr, errc] = std::from_chars(sizeStr.data(), sizeEnd, chunkSize, 16);
  if (errc == std::errc::result_out_of_range) {
    return ChunkedStatus::TooLarge;
  }
  if (sizeStr.empty() || errc != std::errc{} || ptr != sizeEnd) {
    return ChunkedStatus::Malformed;
  }
  return ChunkedStatus::Complete;
}

// Validates the chunked body at the beginning of 'data' (RFC 9112 §7.1) without copying it, resuming
// after the last complete chunk recorded in 'progress'. Chunk extensions and trailer fields are
// accepted and ignored. On Complete, 'consumed' is the number of bytes of the chunked representation,
// trailers included.
ChunkedStatus ScanChunked(std::string_view data, std::size_t maxBodyBytes, ChunkedProgress& progress,
                          std::size_t& consumed) {
  std::size_t pos = progress.offset;
  while (true) {
    const auto lineEnd = data.find(http::CRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return data.size() - pos > kMaxChunkLineLen ? ChunkedStatus::Malformed : ChunkedStatus::NeedMore;
    }
    std::size_t chunkSize;
    const auto sizeStatus = ParseChunkSize(data.substr(pos, lineEnd - pos), chunkSize);
    if (sizeStatus != ChunkedStatus::Complete) {
      return sizeStatus;
    }
    pos = lineEnd + http::CRLF.size();

    if (chunkSize == 0) {
      // trailer section, terminated by an empty line
      while (true) {
        const auto trailerEnd = data.find(http::CRLF, pos);
        if (trailerEnd == std::string_view::npos) {
          return data.size() - pos > kMaxChunkLineLen ? ChunkedStatus::Malformed : ChunkedStatus::NeedMore;
        }
        if (trailerEnd == pos) {
          consumed = pos + http::CRLF.size();
          return ChunkedStatus::Complete;
        }
        pos = trailerEnd + http::CRLF.size();
      }
    }

    if (chunkSize > maxBodyBytes - progress.bodySize) {
      return ChunkedStatus::TooLarge;
    }
    if (data.size() - pos < chunkSize + http::CRLF.size()) {
      return ChunkedStatus::NeedMore;
    }
    pos += chunkSize;
    if (data.substr(pos, http::CRLF.size()) != http::CRLF) {
      return ChunkedStatus::Malformed;
    }
    pos += http::CRLF.size();
    progress.offset = pos;
    progress.bodySize += chunkSize;
  }
}

// Concatenates the chunk payloads of a chunked body already validated by ScanChunked.
std::string DecodeChunked(std::string_view data, std::size_t bodySize) {
  std::string body;
  body.reserve(bodySize);
  std::size_t pos = 0;
  while (true) {
    const auto lineEnd = data.find(http::CRLF, pos);
    std::size_t chunkSize = 0;
    if (ParseChunkSize(data.substr(pos, lineEnd - pos), chunkSize) != ChunkedStatus::Complete || chunkSize == 0) {
      return body;
    }
    pos = lineEnd + http::CRLF.size();
    body.append(data.substr(pos, chunkSize));
    pos += chunkSize + http::CRLF.size();
  }
}

}  // namespace

ParseResult ParseHttpRequest(std::string_view data, const ParserLimits& limits, HttpRequest& request,
                             ChunkedProgress* chunkedProgress) {
  std::size_t start = 0;
  while (data.substr(start).starts_with(http::CRLF)) {
    start += http::CRLF.size();
  }

  const auto headerEnd = data.find(http::DoubleCRLF, start);
  if (headerEnd == std::string_view::npos) {
    if (data.size() - start > limits.maxHeaderBytes) {
      return MakeError(http::StatusCodeRequestHeaderFieldsTooLarge);
    }
    return {};
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  if (bodyStart - start > limits.maxHeaderBytes) {
    return MakeError(http::StatusCodeRequestHeaderFieldsTooLarge);
  }

  const std::string_view head = data.substr(start, headerEnd - start);
  const auto requestLineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, requestLineEnd);
  std::string_view headerLines =
      requestLineEnd == std::string_view::npos ? std::string_view{} : head.substr(requestLineEnd + http::CRLF.size());

  // request-line = method SP request-target SP HTTP-version
  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp) {
    return MakeError(http::StatusCodeBadRequest);
  }
  const std::string_view methodStr = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  const std::string_view versionStr = requestLine.substr(lastSp + 1);
  if (!IsToken(methodStr) || target.empty() || target.find(' ') != std::string_view::npos) {
    return MakeError(http::StatusCodeBadRequest);
  }
  if (versionStr != http::HTTP11Sv && versionStr != http::HTTP10Sv) {
    return MakeError(versionStr.starts_with("HTTP/") ? http::StatusCodeHTTPVersionNotSupported
                                                     : http::StatusCodeBadRequest);
  }
  const auto method = http::MethodStrToOptEnum(methodStr);
  if (!method) {
    return MakeError(http::StatusCodeNotImplemented);
  }
  if (target.front() != '/') {
    return MakeError(http::StatusCodeBadRequest);
  }

  HttpRequest parsed(*method, target);
  parsed.setVersion(versionStr);

  while (!headerLines.empty()) {
    const auto lineEnd = headerLines.find(http::CRLF);
    const std::string_view line = headerLines.substr(0, lineEnd);
    headerLines =
        lineEnd == std::string_view::npos ? std::string_view{} : headerLines.substr(lineEnd + http::CRLF.size());
    const auto colonPos = line.find(':');
    // also rejects obsolete line folding and whitespace before the colon
    if (colonPos == std::string_view::npos || !IsToken(line.substr(0, colonPos))) {
      return MakeError(http::StatusCodeBadRequest);
    }
    parsed.addHeader(line.substr(0, colonPos), line.substr(colonPos + 1));
  }

  if (!parsed.isHttp10() && !parsed.headerValue(http::Host)) {
    return MakeError(http::StatusCodeBadRequest);
  }

  std::optional<std::size_t> contentLength;
  bool hasTransferEncoding = false;
  bool chunked = false;
  for (const auto& [name, value] : parsed.headers()) {
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      const auto len = ParseContentLength(value);
      if (!len || (contentLength && *contentLength != *len)) {
        return MakeError(http::StatusCodeBadRequest);
      }
      contentLength = len;
    } else if (CaseInsensitiveEqual(name, http::TransferEncoding)) {
      hasTransferEncoding = true;
      const auto lastComma = value.rfind(',');
      const std::string_view finalCoding =
          TrimOws(lastComma == std::string::npos ? std::string_view(value) : std::string_view(value).substr(lastComma + 1));
      chunked = CaseInsensitiveEqual(finalCoding, http::chunked);
      if (chunked && lastComma != std::string::npos) {
        // transfer codings other than chunked are not supported
        return MakeError(http::StatusCodeNotImplemented);
      }
    }
  }
  if (hasTransferEncoding && (!chunked || contentLength || parsed.isHttp10())) {
    return MakeError(http::StatusCodeBadRequest);
  }

  ParseResult result;
  result.headersComplete = true;
  const std::string_view rest = data.substr(bodyStart);
  const bool expectContinue =
      rest.empty() && CaseInsensitiveEqual(parsed.headerValueOrEmpty(http::Expect), http::h100_continue);

  if (chunked) {
    ChunkedProgress localProgress;
    ChunkedProgress& progress = chunkedProgress == nullptr ? localProgress : *chunkedProgress;
    std::size_t chunkedLen = 0;
    switch (ScanChunked(rest, limits.maxBodyBytes, progress, chunkedLen)) {
      case ChunkedStatus::NeedMore:
        result.expectContinue = expectContinue;
        return result;
      case ChunkedStatus::Malformed:
        return MakeError(http::StatusCodeBadRequest);
      case ChunkedStatus::TooLarge:
        return MakeError(http::StatusCodePayloadTooLarge);
      case ChunkedStatus::Complete:
        break;
    }
    parsed.setBody(DecodeChunked(rest, progress.bodySize));
    result.consumed = bodyStart + chunkedLen;
  } else if (contentLength) {
    if (*contentLength > limits.maxBodyBytes) {
      return MakeError(http::StatusCodePayloadTooLarge);
    }
    if (rest.size() < *contentLength) {
      result.expectContinue = expectContinue;
      return result;
    }
    parsed.setBody(std::string(rest.substr(0, *contentLength)));
    result.consumed = bodyStart + *contentLength;
  } else {
    result.consumed = bodyStart;
  }

  result.status = ParseResult::Status::Complete;
  request = std::move(parsed);
  return result;
}

}  // namespace portico
