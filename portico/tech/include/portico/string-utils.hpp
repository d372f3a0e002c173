#pragma once

#include <cstddef>
#include <string_view>

namespace portico {

constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch; }

constexpr char toupper(char ch) noexcept { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - 'a' + 'A') : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Removes leading and trailing spaces and horizontal tabs (optional whitespace as defined by RFC 9110).
constexpr std::string_view TrimOws(std::string_view str) noexcept {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

// Returns true if 'list' (comma separated tokens, as found in Connection or Transfer-Encoding headers)
// contains 'token', ignoring case.
constexpr bool CsvContainsIgnoreCase(std::string_view list, std::string_view token) noexcept {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    if (CaseInsensitiveEqual(TrimOws(list.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace portico
