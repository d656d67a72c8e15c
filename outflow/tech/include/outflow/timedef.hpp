#pragma once

#include <chrono>

namespace outflow {

/// system_clock is the only clock with a defined relation to the Unix epoch, used for event timestamps.
/// Intervals (producer period, send durations) are measured with steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;

}  // namespace outflow
