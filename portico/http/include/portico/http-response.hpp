#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-constants.hpp"
#include "portico/http-status-code.hpp"

namespace portico {

class HttpResponse {
 public:
  using HeaderEntry = std::pair<std::string, std::string>;

  // Creates a response with the given status code and reason phrase.
  // An empty reason is replaced by the canonical one (if known) at serialization time.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {})
      : _reason(reason), _statusCode(code) {}

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  // The explicit reason if set, otherwise the canonical reason phrase of the status code.
  [[nodiscard]] std::string_view reason() const noexcept {
    return _reason.empty() ? http::ReasonPhraseFor(_statusCode) : std::string_view(_reason);
  }

  [[nodiscard]] const std::vector<HeaderEntry>& headers() const noexcept { return _headers; }

  // Case-insensitive lookup of the first header named 'key'.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _statusCode = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _statusCode = statusCode;
    return std::move(*this);
  }

  HttpResponse& reason(std::string_view reason) & {
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    _reason.assign(reason);
    return std::move(*this);
  }

  // Sets the header 'key' to 'value', replacing any previous header with the same name (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value) &;

  HttpResponse&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  // Appends a header without checking for existing ones.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.emplace_back(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    return std::move(addHeader(key, value));
  }

  // Sets the body, along with its Content-Type header (not set for an empty body).
  // Content-Length is computed at serialization time.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) &;

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(std::move(body), contentType));
  }

  // Whether the response itself asks for the connection to be closed ("Connection: close").
  [[nodiscard]] bool closeRequested() const noexcept;

  // Appends the HTTP/1.1 wire form of this response to 'out'.
  // Any Content-Length and Connection header set by the user is replaced by the computed ones.
  //  - 'headRequest': the body is omitted, Content-Length still announces its size.
  //  - 'closeConnection': adds "Connection: close".
  void serialize(std::string& out, bool headRequest, bool closeConnection) const;

 private:
  std::string _reason;
  std::vector<HeaderEntry> _headers;
  std::string _body;
  http::StatusCode _statusCode;
};

}  // namespace portico
