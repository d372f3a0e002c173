#include "portico/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "portico/scoped-env-var.hpp"
#include "portico/tls-mode.hpp"

namespace portico {

namespace {

ServerConfig PlainConfig() { return ServerConfig{}.withTlsMode(TlsMode::Off); }

}  // namespace

TEST(ServerConfigTest, Defaults) {
  ServerConfig config;
  EXPECT_EQ(config.bindAddress, "::1");
  EXPECT_EQ(config.port, 0);
  EXPECT_EQ(config.readTimeout, std::chrono::seconds{120});
  EXPECT_EQ(config.writeTimeout, std::chrono::seconds{120});
  EXPECT_EQ(config.idleTimeout.count(), 0);
  EXPECT_EQ(config.headerReadTimeout.count(), 0);
  EXPECT_EQ(config.tlsMode, TlsMode::Tls);
  EXPECT_EQ(config.maxHeaderBytes, 1048576U);
  EXPECT_TRUE(config.enableKeepAlive);
  EXPECT_EQ(config.maxRequestsPerConnection, 0U);
}

TEST(ServerConfigTest, DefaultTlsModeRequiresCertificates) {
  ServerConfig config;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.withTlsCertKey("cert.pem", "key.pem");
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, OffModeDoesNotRequireCertificates) { EXPECT_NO_THROW(PlainConfig().validate()); }

TEST(ServerConfigTest, MutualTlsRequiresCertificatesButNotClientCAs) {
  ServerConfig config = ServerConfig{}.withTlsMode(TlsMode::MutualTls);
  EXPECT_THROW(config.validate(), std::invalid_argument);

  // An empty CA list is reported by the TLS mode resolution, with a dedicated error.
  config.withTlsCertKey("cert.pem", "key.pem");
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, EffectiveTimeoutsFallBackToReadTimeout) {
  ServerConfig config = PlainConfig().withReadTimeout(std::chrono::seconds{7});
  EXPECT_EQ(config.effectiveIdleTimeout(), std::chrono::seconds{7});
  EXPECT_EQ(config.effectiveHeaderReadTimeout(), std::chrono::seconds{7});

  config.withIdleTimeout(std::chrono::seconds{3}).withHeaderReadTimeout(std::chrono::seconds{2});
  EXPECT_EQ(config.effectiveIdleTimeout(), std::chrono::seconds{3});
  EXPECT_EQ(config.effectiveHeaderReadTimeout(), std::chrono::seconds{2});

  config.withReadTimeout(std::chrono::milliseconds{0}).withIdleTimeout({}).withHeaderReadTimeout({});
  EXPECT_EQ(config.effectiveIdleTimeout().count(), 0);
  EXPECT_EQ(config.effectiveHeaderReadTimeout().count(), 0);
}

TEST(ServerConfigTest, BindAddressMustBeAnIpLiteral) {
  EXPECT_NO_THROW(PlainConfig().withBindAddress("127.0.0.1").validate());
  EXPECT_NO_THROW(PlainConfig().withBindAddress("::").validate());
  EXPECT_THROW(PlainConfig().withBindAddress("").validate(), std::invalid_argument);
  EXPECT_THROW(PlainConfig().withBindAddress("localhost").validate(), std::invalid_argument);
  EXPECT_THROW(PlainConfig().withBindAddress("256.1.1.1").validate(), std::invalid_argument);
}

TEST(ServerConfigTest, MaxHeaderBytesRange) {
  EXPECT_NO_THROW(PlainConfig().withMaxHeaderBytes(ServerConfig::kMinHeaderBytes).validate());
  EXPECT_NO_THROW(PlainConfig().withMaxHeaderBytes(ServerConfig::kMaxHeaderBytes).validate());
  EXPECT_THROW(PlainConfig().withMaxHeaderBytes(ServerConfig::kMinHeaderBytes - 1).validate(), std::invalid_argument);
  EXPECT_THROW(PlainConfig().withMaxHeaderBytes(ServerConfig::kMaxHeaderBytes + 1).validate(), std::invalid_argument);
}

TEST(ServerConfigTest, InvalidLimits) {
  EXPECT_THROW(PlainConfig().withMaxBodyBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(PlainConfig().withPollInterval(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(PlainConfig().withReadTimeout(std::chrono::milliseconds{-1}).validate(), std::invalid_argument);
}

TEST(ServerConfigTest, EffectiveNbWorkerThreads) {
  EXPECT_GE(PlainConfig().effectiveNbWorkerThreads(), 1U);
  EXPECT_EQ(PlainConfig().withNbWorkerThreads(3).effectiveNbWorkerThreads(), 3U);
}

class ServerConfigEnvTest : public ::testing::Test {
 protected:
  // Neutralizes variables possibly set in the test environment.
  test::ScopedEnvVar bindIp{"HTTP_SERVER_BIND_IP", nullptr};
  test::ScopedEnvVar bindPort{"HTTP_SERVER_BIND_PORT", nullptr};
  test::ScopedEnvVar readTimeout{"HTTP_SERVER_READ_TIMEOUT_SECONDS", nullptr};
  test::ScopedEnvVar writeTimeout{"HTTP_SERVER_WRITE_TIMEOUT_SECONDS", nullptr};
  test::ScopedEnvVar idleTimeout{"HTTP_SERVER_IDLE_TIMEOUT_SECONDS", nullptr};
  test::ScopedEnvVar headerTimeout{"HTTP_SERVER_HEADER_READ_TIMEOUT_SECONDS", nullptr};
  test::ScopedEnvVar cert{"HTTP_SERVER_CERT", nullptr};
  test::ScopedEnvVar key{"HTTP_SERVER_KEY", nullptr};
  test::ScopedEnvVar clientCas{"HTTP_SERVER_CLIENT_CA_CERTS", nullptr};
  test::ScopedEnvVar maxHeaderBytes{"HTTP_SERVER_MAX_HEADER_BYTES", nullptr};
  test::ScopedEnvVar maxBodyBytes{"HTTP_SERVER_MAX_BODY_BYTES", nullptr};
  test::ScopedEnvVar keepAlive{"HTTP_SERVER_KEEP_ALIVE", nullptr};
  test::ScopedEnvVar nbThreads{"HTTP_SERVER_NB_WORKER_THREADS", nullptr};
  test::ScopedEnvVar tlsMode{"HTTP_SERVER_TLS_MODE", "off"};
};

TEST_F(ServerConfigEnvTest, DefaultsWhenUnset) {
  const ServerConfig config = ServerConfig::FromEnv();
  EXPECT_EQ(config, ServerConfig{}.withTlsMode(TlsMode::Off));
}

TEST_F(ServerConfigEnvTest, OverridesEveryField) {
  test::ScopedEnvVar ip("HTTP_SERVER_BIND_IP", "0.0.0.0");
  test::ScopedEnvVar port("HTTP_SERVER_BIND_PORT", "8443");
  test::ScopedEnvVar read("HTTP_SERVER_READ_TIMEOUT_SECONDS", "30");
  test::ScopedEnvVar write("HTTP_SERVER_WRITE_TIMEOUT_SECONDS", "31");
  test::ScopedEnvVar idle("HTTP_SERVER_IDLE_TIMEOUT_SECONDS", "5");
  test::ScopedEnvVar header("HTTP_SERVER_HEADER_READ_TIMEOUT_SECONDS", "2");
  test::ScopedEnvVar mode("HTTP_SERVER_TLS_MODE", "mutual_tls");
  test::ScopedEnvVar certFile("HTTP_SERVER_CERT", "/etc/portico/server.pem");
  test::ScopedEnvVar keyFile("HTTP_SERVER_KEY", "/etc/portico/server.key");
  test::ScopedEnvVar cas("HTTP_SERVER_CLIENT_CA_CERTS", "/etc/portico/ca1.pem, /etc/portico/ca2.pem,");
  test::ScopedEnvVar headerBytes("HTTP_SERVER_MAX_HEADER_BYTES", "8192");
  test::ScopedEnvVar bodyBytes("HTTP_SERVER_MAX_BODY_BYTES", "1024");
  test::ScopedEnvVar keepAliveVar("HTTP_SERVER_KEEP_ALIVE", "false");
  test::ScopedEnvVar threads("HTTP_SERVER_NB_WORKER_THREADS", "4");

  const ServerConfig config = ServerConfig::FromEnv();
  EXPECT_EQ(config.bindAddress, "0.0.0.0");
  EXPECT_EQ(config.port, 8443);
  EXPECT_EQ(config.readTimeout, std::chrono::seconds{30});
  EXPECT_EQ(config.writeTimeout, std::chrono::seconds{31});
  EXPECT_EQ(config.idleTimeout, std::chrono::seconds{5});
  EXPECT_EQ(config.headerReadTimeout, std::chrono::seconds{2});
  EXPECT_EQ(config.tlsMode, TlsMode::MutualTls);
  EXPECT_EQ(config.certFile, "/etc/portico/server.pem");
  EXPECT_EQ(config.keyFile, "/etc/portico/server.key");
  EXPECT_EQ(config.clientCaFiles, (std::vector<std::string>{"/etc/portico/ca1.pem", "/etc/portico/ca2.pem"}));
  EXPECT_EQ(config.maxHeaderBytes, 8192U);
  EXPECT_EQ(config.maxBodyBytes, 1024U);
  EXPECT_FALSE(config.enableKeepAlive);
  EXPECT_EQ(config.nbWorkerThreads, 4U);
}

TEST_F(ServerConfigEnvTest, ParseErrorsNameTheVariable) {
  {
    test::ScopedEnvVar port("HTTP_SERVER_BIND_PORT", "70000");
    try {
      [[maybe_unused]] auto config = ServerConfig::FromEnv();
      FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& ex) {
      EXPECT_NE(std::string(ex.what()).find("HTTP_SERVER_BIND_PORT"), std::string::npos);
    }
  }
  {
    test::ScopedEnvVar timeout("HTTP_SERVER_READ_TIMEOUT_SECONDS", "-3");
    EXPECT_THROW([[maybe_unused]] auto config = ServerConfig::FromEnv(), std::invalid_argument);
  }
  {
    test::ScopedEnvVar keepAliveVar("HTTP_SERVER_KEEP_ALIVE", "sometimes");
    EXPECT_THROW([[maybe_unused]] auto config = ServerConfig::FromEnv(), std::invalid_argument);
  }
  {
    test::ScopedEnvVar mode("HTTP_SERVER_TLS_MODE", "TLS");
    try {
      [[maybe_unused]] auto config = ServerConfig::FromEnv();
      FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& ex) {
      EXPECT_NE(std::string(ex.what()).find("HTTP_SERVER_TLS_MODE"), std::string::npos);
    }
  }
}

TEST_F(ServerConfigEnvTest, ResultIsValidated) {
  test::ScopedEnvVar mode("HTTP_SERVER_TLS_MODE", "tls");
  EXPECT_THROW([[maybe_unused]] auto config = ServerConfig::FromEnv(), std::invalid_argument);

  test::ScopedEnvVar headerBytes("HTTP_SERVER_MAX_HEADER_BYTES", "100");
  test::ScopedEnvVar off("HTTP_SERVER_TLS_MODE", "off");
  EXPECT_THROW([[maybe_unused]] auto config = ServerConfig::FromEnv(), std::invalid_argument);
}

}  // namespace portico
