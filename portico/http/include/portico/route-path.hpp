#pragma once

#include <string_view>

namespace portico {

// Checks a route path pattern against the route grammar:
//  - "/" alone is valid,
//  - otherwise only [a-zA-Z0-9/{}], a leading '/' and no trailing '/',
//  - non-empty segments, pairwise distinct,
//  - a segment containing a brace is a parameter "{name}" with a non-empty name.
// Returns the reason of the first violation found, or an empty string_view if the path is valid.
std::string_view RoutePathError(std::string_view path) noexcept;

// Throws std::invalid_argument 'endpoint path "<path>" is not correctly formatted (<reason>)' if the path is invalid.
void ValidateRoutePath(std::string_view path);

// Whether the segment is a parameter segment "{name}". Only meaningful for valid paths.
constexpr bool IsParamSegment(std::string_view segment) noexcept {
  return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

}  // namespace portico
