#include "portico/interceptor.hpp"

#include <cstddef>
#include <span>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace portico {

RequestHandler MakeChain(std::span<const Interceptor> interceptors, RequestHandler terminal) {
  if (!terminal) {
    throw std::invalid_argument("the terminal handler of an interceptor chain cannot be empty");
  }
  RequestHandler handler = std::move(terminal);
  for (std::size_t pos = interceptors.size(); pos != 0; --pos) {
    const Interceptor& interceptor = interceptors[pos - 1];
    if (!interceptor) {
      continue;
    }
    handler = interceptor(std::move(handler));
    if (!handler) {
      throw std::invalid_argument(fmt::format("interceptor #{} returned an empty handler", pos - 1));
    }
  }
  return handler;
}

}  // namespace portico
