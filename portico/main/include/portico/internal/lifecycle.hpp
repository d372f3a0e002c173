#pragma once

#include <atomic>
#include <cstdint>

#include "portico/timedef.hpp"

namespace portico::internal {

// Lifecycle flags of a Server, shared between the thread calling run(), the threads calling shutdown()
// and the reactors.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining, Stopped };

  Lifecycle() = default;

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle(Lifecycle&&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;
  Lifecycle& operator=(Lifecycle&&) = delete;

  ~Lifecycle() = default;

  // Returns true for the first call only.
  [[nodiscard]] bool tryMarkRan() noexcept { return !ran.exchange(true); }

  // Returns true for the first call only.
  [[nodiscard]] bool tryMarkShutdownRequested() noexcept { return !shutdownRequested.exchange(true); }

  [[nodiscard]] bool isShutdownRequested() const noexcept { return shutdownRequested.load(); }

  void enterRunning() noexcept { state.store(State::Running, std::memory_order_release); }

  // The deadline is written before the state is published: a reactor observing Draining reads a
  // consistent deadline.
  void enterDraining(SteadyTimePoint deadline, bool enabled) noexcept {
    drainDeadline = deadline;
    drainDeadlineEnabled = enabled;
    state.store(State::Draining, std::memory_order_release);
  }

  void enterStopped() noexcept { state.store(State::Stopped, std::memory_order_release); }

  [[nodiscard]] State current() const noexcept { return state.load(std::memory_order_acquire); }

  [[nodiscard]] bool isIdle() const noexcept { return current() == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return current() == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return current() == State::Draining; }
  [[nodiscard]] bool isStopped() const noexcept { return current() == State::Stopped; }
  [[nodiscard]] bool acceptingConnections() const noexcept { return isRunning(); }

  // Only meaningful once Draining has been observed.
  [[nodiscard]] bool hasDeadline() const noexcept { return drainDeadlineEnabled; }
  [[nodiscard]] SteadyTimePoint deadline() const noexcept { return drainDeadline; }

  SteadyTimePoint drainDeadline;
  std::atomic<State> state{State::Idle};
  bool drainDeadlineEnabled{false};

  std::atomic<bool> ran{false};
  std::atomic<bool> shutdownRequested{false};
};

}  // namespace portico::internal
