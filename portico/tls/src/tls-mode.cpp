#include "portico/tls-mode.hpp"

#include <fmt/format.h>

#include <string_view>

#include "portico/tls-config-error.hpp"

namespace portico {

namespace {
constexpr std::string_view kOff = "off";
constexpr std::string_view kTls = "tls";
constexpr std::string_view kMutualTls = "mutual_tls";
}  // namespace

std::string_view TlsModeToString(TlsMode mode) {
  switch (mode) {
    case TlsMode::Off:
      return kOff;
    case TlsMode::Tls:
      return kTls;
    case TlsMode::MutualTls:
      return kMutualTls;
    default:
      throw TlsConfigError(TlsConfigError::Kind::InvalidMode,
                           fmt::format("invalid TLS mode: {}", static_cast<int>(mode)));
  }
}

TlsMode TlsModeFromString(std::string_view value) {
  if (value == kOff) {
    return TlsMode::Off;
  }
  if (value == kTls) {
    return TlsMode::Tls;
  }
  if (value == kMutualTls) {
    return TlsMode::MutualTls;
  }
  throw TlsConfigError(TlsConfigError::Kind::InvalidMode, fmt::format("invalid TLS mode: {}", value));
}

}  // namespace portico
