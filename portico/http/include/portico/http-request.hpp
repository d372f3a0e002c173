#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"

namespace portico {

class HttpRequest {
 public:
  using HeaderEntry = std::pair<std::string, std::string>;
  using PathParam = std::pair<std::string, std::string>;

  HttpRequest() noexcept = default;

  // Builds a request for the given target ("/path?query"). Mostly useful for tests and for
  // dispatching requests that did not come from the wire.
  HttpRequest(http::Method method, std::string_view target);

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The request target without the query string. It cannot be empty.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // "HTTP/1.0" or "HTTP/1.1"
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] bool isHttp10() const noexcept { return _version == http::HTTP10Sv; }

  // Headers in reception order, values trimmed of surrounding whitespace. Duplicates are kept.
  [[nodiscard]] const std::vector<HeaderEntry>& headers() const noexcept { return _headers; }

  // Case-insensitive lookup of the first header named 'name'.
  // std::nullopt if absent, an engaged empty view if present with an empty value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Decoded body (Content-Length or chunked). Empty if the request has none.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Value of the path parameter 'name' captured by the matched route pattern (e.g. "id" for "/items/{id}").
  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view name) const noexcept;

  // All captured path parameters, in pattern order.
  [[nodiscard]] const std::vector<PathParam>& pathParams() const noexcept { return _pathParams; }

  // Whether the client asked to keep the connection open after this request
  // (HTTP/1.1 unless "Connection: close", HTTP/1.0 only with "Connection: keep-alive").
  [[nodiscard]] bool keepAliveRequested() const noexcept;

  // TLS session details. All empty for plain connections.
  [[nodiscard]] bool isTls() const noexcept { return !_tlsVersion.empty(); }
  [[nodiscard]] std::string_view tlsVersion() const noexcept { return _tlsVersion; }
  [[nodiscard]] std::string_view tlsCipher() const noexcept { return _tlsCipher; }

  // One-line subject of the client certificate verified during a mutual TLS handshake.
  [[nodiscard]] std::string_view tlsPeerSubject() const noexcept { return _tlsPeerSubject; }

  HttpRequest& addHeader(std::string_view name, std::string_view value);

  HttpRequest& setBody(std::string body) noexcept {
    _body = std::move(body);
    return *this;
  }

  HttpRequest& setVersion(std::string_view version) noexcept {
    _version = version == http::HTTP10Sv ? http::HTTP10Sv : http::HTTP11Sv;
    return *this;
  }

  HttpRequest& setTlsInfo(std::string version, std::string cipher, std::string peerSubject) noexcept {
    _tlsVersion = std::move(version);
    _tlsCipher = std::move(cipher);
    _tlsPeerSubject = std::move(peerSubject);
    return *this;
  }

  void setPathParams(std::vector<PathParam> pathParams) noexcept { _pathParams = std::move(pathParams); }

 private:
  std::string _path;
  std::string _query;
  std::vector<HeaderEntry> _headers;
  std::string _body;
  std::vector<PathParam> _pathParams;
  std::string _tlsVersion;
  std::string _tlsCipher;
  std::string _tlsPeerSubject;
  std::string_view _version{http::HTTP11Sv};
  http::Method _method{http::Method::GET};
};

}  // namespace portico
