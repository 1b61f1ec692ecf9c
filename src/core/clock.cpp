#include <agent_relay/core/clock.hpp>

#include <thread>

namespace agent_relay {

TimePoint SystemNow() {
    return WallClock::now();
}

void SystemSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::int64_t ToEpochMillis(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint FromEpochMillis(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<WallClock::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace agent_relay
