#pragma once

#include <cstdint>
#include <string>

namespace portico {

// Snapshot of the counters of a Server, aggregated over all its reactors.
struct ServerStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of the fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("connectionsAccepted", connectionsAccepted);
    fun("requestsServed", requestsServed);
    fun("tlsHandshakesSucceeded", tlsHandshakesSucceeded);
    fun("tlsHandshakesFailed", tlsHandshakesFailed);
    fun("connectionsTimedOut", connectionsTimedOut);
    fun("connectionsForciblyClosed", connectionsForciblyClosed);
    fun("drainsPerformed", drainsPerformed);
  }

  bool operator==(const ServerStats&) const = default;

  uint64_t connectionsAccepted{};
  uint64_t requestsServed{};
  uint64_t tlsHandshakesSucceeded{};
  uint64_t tlsHandshakesFailed{};
  // Connections closed because one of the configured timeouts expired.
  uint64_t connectionsTimedOut{};
  // Connections still open when the drain deadline expired.
  uint64_t connectionsForciblyClosed{};
  // Number of graceful drains actually performed (at most 1 per Server).
  uint64_t drainsPerformed{};
};

}  // namespace portico
