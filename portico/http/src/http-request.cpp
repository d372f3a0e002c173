#include "portico/http-request.hpp"

#include <optional>
#include <string_view>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/string-utils.hpp"

namespace portico {

HttpRequest::HttpRequest(http::Method method, std::string_view target) : _method(method) {
  const auto queryPos = target.find('?');
  _path.assign(target.substr(0, queryPos));
  if (queryPos != std::string_view::npos) {
    _query.assign(target.substr(queryPos + 1));
  }
  if (_path.empty()) {
    _path.push_back('/');
  }
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::pathParam(std::string_view name) const noexcept {
  for (const auto& [paramName, paramValue] : _pathParams) {
    if (paramName == name) {
      return std::string_view(paramValue);
    }
  }
  return std::nullopt;
}

bool HttpRequest::keepAliveRequested() const noexcept {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (isHttp10()) {
    return CsvContainsIgnoreCase(connection, http::keepalive);
  }
  return !CsvContainsIgnoreCase(connection, http::close);
}

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, TrimOws(value));
  return *this;
}

}  // namespace portico
