#include "portico/server-stats.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace portico {

std::string ServerStats::json_str() const {
  std::string out;
  out.reserve(256UL);
  out.push_back('{');
  for_each_field([&out](std::string_view name, uint64_t value) {
    if (out.size() > 1U) {
      out.push_back(',');
    }
    fmt::format_to(std::back_inserter(out), "\"{}\":{}", name, value);
  });
  out.push_back('}');
  return out;
}

}  // namespace portico
