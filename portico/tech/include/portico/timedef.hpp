#pragma once

#include <chrono>

namespace portico {

/// Connection deadlines and drain deadlines are measured on the monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

/// Durations are expressed in milliseconds in configuration and at API boundaries.
using Duration = std::chrono::milliseconds;

}  // namespace portico
