#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace agent_relay {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

// Injected so expiry logic can be driven by tests.
using NowFn = std::function<TimePoint()>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;

TimePoint SystemNow();
void SystemSleep(std::chrono::milliseconds duration);

/// Milliseconds since the Unix epoch (snapshot files).
std::int64_t ToEpochMillis(TimePoint t);
TimePoint FromEpochMillis(std::int64_t ms);

} // namespace agent_relay
