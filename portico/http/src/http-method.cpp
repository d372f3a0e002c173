#include "portico/http-method.hpp"

#include <optional>
#include <string_view>

namespace portico::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept {
  switch (str.size()) {
    case 3:  // GET, PUT
      if (str == "GET") {
        return Method::GET;
      }
      if (str == "PUT") {
        return Method::PUT;
      }
      return std::nullopt;
    case 4:  // HEAD, POST
      if (str == "HEAD") {
        return Method::HEAD;
      }
      if (str == "POST") {
        return Method::POST;
      }
      return std::nullopt;
    case 5:  // TRACE, PATCH
      if (str == "TRACE") {
        return Method::TRACE;
      }
      if (str == "PATCH") {
        return Method::PATCH;
      }
      return std::nullopt;
    case 6:
      return str == "DELETE" ? std::optional<Method>(Method::DELETE) : std::nullopt;
    case 7:  // CONNECT, OPTIONS
      if (str == "CONNECT") {
        return Method::CONNECT;
      }
      if (str == "OPTIONS") {
        return Method::OPTIONS;
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace portico::http
