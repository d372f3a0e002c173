#include "portico/http-response.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "portico/http-constants.hpp"
#include "portico/string-utils.hpp"

namespace portico {

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(_headers, [key](const auto& entry) { return CaseInsensitiveEqual(entry.first, key); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) & {
  std::erase_if(_headers, [key](const auto& entry) { return CaseInsensitiveEqual(entry.first, key); });
  _headers.emplace_back(key, value);
  return *this;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) & {
  _body = std::move(body);
  if (_body.empty()) {
    std::erase_if(_headers, [](const auto& entry) { return CaseInsensitiveEqual(entry.first, http::ContentType); });
  } else if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

bool HttpResponse::closeRequested() const noexcept {
  const auto connection = headerValue(http::Connection);
  return connection && CsvContainsIgnoreCase(*connection, http::close);
}

void HttpResponse::serialize(std::string& out, bool headRequest, bool closeConnection) const {
  auto outIt = std::back_inserter(out);
  fmt::format_to(outIt, "{} {} {}{}", http::HTTP11Sv, _statusCode, reason(), http::CRLF);
  for (const auto& [key, value] : _headers) {
    if (CaseInsensitiveEqual(key, http::ContentLength) || CaseInsensitiveEqual(key, http::Connection)) {
      continue;
    }
    fmt::format_to(outIt, "{}{}{}{}", key, http::HeaderSep, value, http::CRLF);
  }
  if (closeConnection) {
    fmt::format_to(outIt, "{}{}{}{}", http::Connection, http::HeaderSep, http::close, http::CRLF);
  }
  fmt::format_to(outIt, "{}{}{}{}", http::ContentLength, http::HeaderSep, _body.size(), http::DoubleCRLF);
  if (!headRequest) {
    out.append(_body);
  }
}

}  // namespace portico
