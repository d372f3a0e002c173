#pragma once

#include <atomic>
#include <cstdint>

#include "portico/server-stats.hpp"

namespace portico::internal {

// Counters updated concurrently by the reactors.
struct StatsCounters {
  [[nodiscard]] ServerStats snapshot() const noexcept {
    ServerStats stats;
    stats.connectionsAccepted = connectionsAccepted.load(std::memory_order_relaxed);
    stats.requestsServed = requestsServed.load(std::memory_order_relaxed);
    stats.tlsHandshakesSucceeded = tlsHandshakesSucceeded.load(std::memory_order_relaxed);
    stats.tlsHandshakesFailed = tlsHandshakesFailed.load(std::memory_order_relaxed);
    stats.connectionsTimedOut = connectionsTimedOut.load(std::memory_order_relaxed);
    stats.connectionsForciblyClosed = connectionsForciblyClosed.load(std::memory_order_relaxed);
    stats.drainsPerformed = drainsPerformed.load(std::memory_order_relaxed);
    return stats;
  }

  std::atomic<uint64_t> connectionsAccepted{0};
  std::atomic<uint64_t> requestsServed{0};
  std::atomic<uint64_t> tlsHandshakesSucceeded{0};
  std::atomic<uint64_t> tlsHandshakesFailed{0};
  std::atomic<uint64_t> connectionsTimedOut{0};
  std::atomic<uint64_t> connectionsForciblyClosed{0};
  std::atomic<uint64_t> drainsPerformed{0};
};

}  // namespace portico::internal
