#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "portico/tls-mode.hpp"

namespace portico {

struct ServerConfig {
  static constexpr std::size_t kMinHeaderBytes = 4096;
  static constexpr std::size_t kMaxHeaderBytes = 1UL << 30;

  // Builds a configuration from the HTTP_SERVER_* environment variables, starting from the defaults
  // below for every variable that is not set. The result is validated.
  // Throws std::invalid_argument naming the faulty variable if a value cannot be parsed.
  static ServerConfig FromEnv();

  // ============================
  // Listener parameters
  // ============================
  // IPv4 or IPv6 literal to bind to.
  std::string bindAddress{"::1"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, reported to the bound callback.
  uint16_t port{0};

  // ============================
  // Timeouts (0 means no timeout)
  // ============================
  // Maximum duration to receive a whole request, from its first byte.
  std::chrono::milliseconds readTimeout{std::chrono::seconds{120}};

  // Maximum duration to flush a response to the client.
  std::chrono::milliseconds writeTimeout{std::chrono::seconds{120}};

  // Maximum wait for the next request on a keep-alive connection. Falls back to readTimeout when 0.
  std::chrono::milliseconds idleTimeout{0};

  // Maximum duration to receive the request line and headers (and to complete the TLS handshake).
  // Falls back to readTimeout when 0.
  std::chrono::milliseconds headerReadTimeout{0};

  // ============================
  // Transport security
  // ============================
  TlsMode tlsMode{TlsMode::Tls};

  // PEM files of the server certificate chain and its private key. Required unless tlsMode is Off.
  std::string certFile;
  std::string keyFile;

  // PEM files of the CAs trusted to issue client certificates. Used in MutualTls mode only.
  std::vector<std::string> clientCaFiles;

  // ============================
  // Request limits
  // ============================
  // Maximum size of the request line and headers. Exceeding requests get 431.
  std::size_t maxHeaderBytes{1UL << 20};

  // Maximum size of a decoded request body. Exceeding requests get 413.
  std::size_t maxBodyBytes{64UL << 20};

  // ============================
  // Connection management
  // ============================
  // Whether persistent connections are allowed. When false every response closes the connection.
  bool enableKeepAlive{true};

  // Number of requests served on one connection before closing it. 0 means unlimited.
  uint32_t maxRequestsPerConnection{0};

  // Number of reactor threads. 0 selects the hardware concurrency.
  uint32_t nbWorkerThreads{0};

  // Maximum blocking time of each reactor poll, also the period of timeout checks.
  std::chrono::milliseconds pollInterval{100};

  ServerConfig& withBindAddress(std::string_view bindAddress);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withWriteTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withIdleTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withTlsMode(TlsMode mode);

  ServerConfig& withTlsCertKey(std::string_view certFile, std::string_view keyFile);

  ServerConfig& withClientCaFiles(std::vector<std::string> caFiles);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  ServerConfig& withNbWorkerThreads(uint32_t nbWorkerThreads);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  [[nodiscard]] std::chrono::milliseconds effectiveIdleTimeout() const noexcept {
    return idleTimeout.count() == 0 ? readTimeout : idleTimeout;
  }

  [[nodiscard]] std::chrono::milliseconds effectiveHeaderReadTimeout() const noexcept {
    return headerReadTimeout.count() == 0 ? readTimeout : headerReadTimeout;
  }

  // Resolved number of reactor threads (at least 1).
  [[nodiscard]] uint32_t effectiveNbWorkerThreads() const noexcept;

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const ServerConfig&) const = default;
};

}  // namespace portico
