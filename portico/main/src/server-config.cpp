#include "portico/server-config.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "portico/string-utils.hpp"
#include "portico/tls-config-error.hpp"
#include "portico/tls-mode.hpp"

namespace portico {

namespace {

bool IsIpLiteral(const std::string& address) {
  in6_addr addr6{};
  in_addr addr4{};
  return ::inet_pton(AF_INET, address.c_str(), &addr4) == 1 || ::inet_pton(AF_INET6, address.c_str(), &addr6) == 1;
}

[[noreturn]] void ThrowInvalidEnv(const char* name, std::string_view value, std::string_view expected) {
  throw std::invalid_argument(
      fmt::format("invalid value '{}' for environment variable {} (expected {})", value, name, expected));
}

template <class T>
bool ReadUnsignedEnv(const char* name, T& out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }
  const std::string_view value = TrimOws(raw);
  T parsed{};
  const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || errc != std::errc{} || ptr != value.data() + value.size()) {
    ThrowInvalidEnv(name, raw, fmt::format("an integer in [0, {}]", std::numeric_limits<T>::max()));
  }
  out = parsed;
  return true;
}

void ReadSecondsEnv(const char* name, std::chrono::milliseconds& out) {
  uint32_t seconds{};
  if (ReadUnsignedEnv(name, seconds)) {
    out = std::chrono::seconds{seconds};
  }
}

void ReadStringEnv(const char* name, std::string& out) {
  if (const char* raw = std::getenv(name)) {
    out = TrimOws(raw);
  }
}

void ReadBoolEnv(const char* name, bool& out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return;
  }
  const std::string_view value = TrimOws(raw);
  if (value == "1" || CaseInsensitiveEqual(value, "true")) {
    out = true;
  } else if (value == "0" || CaseInsensitiveEqual(value, "false")) {
    out = false;
  } else {
    ThrowInvalidEnv(name, raw, "true, false, 1 or 0");
  }
}

std::vector<std::string> SplitPathList(std::string_view list) {
  std::vector<std::string> paths;
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    const std::string_view item = TrimOws(list.substr(0, commaPos));
    if (!item.empty()) {
      paths.emplace_back(item);
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return paths;
}

}  // namespace

ServerConfig ServerConfig::FromEnv() {
  ServerConfig config;

  ReadStringEnv("HTTP_SERVER_BIND_IP", config.bindAddress);
  ReadUnsignedEnv("HTTP_SERVER_BIND_PORT", config.port);

  ReadSecondsEnv("HTTP_SERVER_READ_TIMEOUT_SECONDS", config.readTimeout);
  ReadSecondsEnv("HTTP_SERVER_WRITE_TIMEOUT_SECONDS", config.writeTimeout);
  ReadSecondsEnv("HTTP_SERVER_IDLE_TIMEOUT_SECONDS", config.idleTimeout);
  ReadSecondsEnv("HTTP_SERVER_HEADER_READ_TIMEOUT_SECONDS", config.headerReadTimeout);

  if (const char* mode = std::getenv("HTTP_SERVER_TLS_MODE")) {
    try {
      config.tlsMode = TlsModeFromString(TrimOws(mode));
    } catch (const TlsConfigError&) {
      ThrowInvalidEnv("HTTP_SERVER_TLS_MODE", mode, "off, tls or mutual_tls");
    }
  }
  ReadStringEnv("HTTP_SERVER_CERT", config.certFile);
  ReadStringEnv("HTTP_SERVER_KEY", config.keyFile);
  if (const char* caList = std::getenv("HTTP_SERVER_CLIENT_CA_CERTS")) {
    config.clientCaFiles = SplitPathList(caList);
  }

  ReadUnsignedEnv("HTTP_SERVER_MAX_HEADER_BYTES", config.maxHeaderBytes);
  ReadUnsignedEnv("HTTP_SERVER_MAX_BODY_BYTES", config.maxBodyBytes);
  ReadBoolEnv("HTTP_SERVER_KEEP_ALIVE", config.enableKeepAlive);
  ReadUnsignedEnv("HTTP_SERVER_NB_WORKER_THREADS", config.nbWorkerThreads);

  config.validate();
  return config;
}

ServerConfig& ServerConfig::withBindAddress(std::string_view bindAddress) {
  this->bindAddress = bindAddress;
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReadTimeout(std::chrono::milliseconds timeout) {
  this->readTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withWriteTimeout(std::chrono::milliseconds timeout) {
  this->writeTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withIdleTimeout(std::chrono::milliseconds timeout) {
  this->idleTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  this->headerReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withTlsMode(TlsMode mode) {
  this->tlsMode = mode;
  return *this;
}

ServerConfig& ServerConfig::withTlsCertKey(std::string_view certFile, std::string_view keyFile) {
  this->certFile = certFile;
  this->keyFile = keyFile;
  return *this;
}

ServerConfig& ServerConfig::withClientCaFiles(std::vector<std::string> caFiles) {
  this->clientCaFiles = std::move(caFiles);
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

ServerConfig& ServerConfig::withNbWorkerThreads(uint32_t nbWorkerThreads) {
  this->nbWorkerThreads = nbWorkerThreads;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

uint32_t ServerConfig::effectiveNbWorkerThreads() const noexcept {
  if (nbWorkerThreads != 0) {
    return nbWorkerThreads;
  }
  const auto hardwareConcurrency = std::thread::hardware_concurrency();
  return hardwareConcurrency == 0 ? 1U : hardwareConcurrency;
}

void ServerConfig::validate() const {
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress cannot be empty");
  }
  if (!IsIpLiteral(bindAddress)) {
    throw std::invalid_argument(fmt::format("bindAddress '{}' is not an IPv4 or IPv6 address", bindAddress));
  }
  if (readTimeout.count() < 0 || writeTimeout.count() < 0 || idleTimeout.count() < 0 ||
      headerReadTimeout.count() < 0) {
    throw std::invalid_argument("timeouts must be non-negative");
  }
  if (tlsMode != TlsMode::Off && (certFile.empty() || keyFile.empty())) {
    throw std::invalid_argument(
        fmt::format("certFile and keyFile are required when the TLS mode is '{}'", TlsModeToString(tlsMode)));
  }
  if (maxHeaderBytes < kMinHeaderBytes || maxHeaderBytes > kMaxHeaderBytes) {
    throw std::invalid_argument(
        fmt::format("maxHeaderBytes must be in [{}, {}]", kMinHeaderBytes, kMaxHeaderBytes));
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (pollInterval.count() > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("pollInterval value is too large");
  }
}

}  // namespace portico
