#include "portico/tls-mode.hpp"

#include <gtest/gtest.h>

#include <string>

#include "portico/tls-config-error.hpp"

namespace portico {

TEST(TlsMode, ParsesKnownValues) {
  EXPECT_EQ(TlsModeFromString("off"), TlsMode::Off);
  EXPECT_EQ(TlsModeFromString("tls"), TlsMode::Tls);
  EXPECT_EQ(TlsModeFromString("mutual_tls"), TlsMode::MutualTls);
}

TEST(TlsMode, RoundTripsThroughString) {
  for (TlsMode mode : {TlsMode::Off, TlsMode::Tls, TlsMode::MutualTls}) {
    EXPECT_EQ(TlsModeFromString(TlsModeToString(mode)), mode);
  }
}

TEST(TlsMode, RejectsUnknownValue) {
  for (const char* value : {"", "TLS", "mtls", "mutual-tls", "on"}) {
    try {
      static_cast<void>(TlsModeFromString(value));
      FAIL() << "expected failure for '" << value << "'";
    } catch (const TlsConfigError& ex) {
      EXPECT_EQ(ex.kind(), TlsConfigError::Kind::InvalidMode);
      EXPECT_EQ(std::string(ex.what()), std::string("invalid TLS mode: ") + value);
    }
  }
}

TEST(TlsMode, ToStringRejectsOutOfRangeValue) {
  EXPECT_THROW(static_cast<void>(TlsModeToString(static_cast<TlsMode>(42))), TlsConfigError);
}

}  // namespace portico
