#include "portico/route-path.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace portico {

namespace {

constexpr bool IsValidPathChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '/' || ch == '{' ||
         ch == '}';
}

std::string_view SegmentError(std::string_view segment) noexcept {
  if (segment.empty()) {
    return "the path parts cannot be empty";
  }
  if (segment.find_first_of("{}") == std::string_view::npos) {
    return {};
  }
  if (segment.front() != '{' || segment.back() != '}') {
    return "the path parameters must start with '{' and end with '}'";
  }
  if (std::ranges::count(segment, '{') != 1 || std::ranges::count(segment, '}') != 1) {
    return "the path parameters must have only one '{' and '}'";
  }
  if (segment == "{}") {
    return "the path parameters cannot be empty";
  }
  return {};
}

}  // namespace

std::string_view RoutePathError(std::string_view path) noexcept {
  if (path.empty()) {
    return "the path cannot be empty";
  }
  if (path == "/") {
    return {};
  }
  if (!std::ranges::all_of(path, IsValidPathChar)) {
    return "the path contains invalid characters";
  }
  if (path.front() != '/') {
    return "the path must start with '/'";
  }
  if (path.back() == '/') {
    return "the path cannot end with '/'";
  }

  std::vector<std::string_view> seenSegments;
  path.remove_prefix(1);
  while (true) {
    const auto slashPos = path.find('/');
    const auto segment = path.substr(0, slashPos);
    if (const auto reason = SegmentError(segment); !reason.empty()) {
      return reason;
    }
    if (std::ranges::find(seenSegments, segment) != seenSegments.end()) {
      return "the path parts must be unique";
    }
    seenSegments.push_back(segment);
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
  return {};
}

void ValidateRoutePath(std::string_view path) {
  const auto reason = RoutePathError(path);
  if (!reason.empty()) {
    throw std::invalid_argument(fmt::format("endpoint path \"{}\" is not correctly formatted ({})", path, reason));
  }
}

}  // namespace portico
