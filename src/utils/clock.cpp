#include "clock.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace BeanTrader {

long long SystemClock::now_milliseconds() const {
    return TimeUtils::current_epoch_milliseconds();
}

void SystemClock::sleep_for_milliseconds(long long duration_milliseconds) {
    if (duration_milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(duration_milliseconds));
    }
}

bool sleep_while_running(Clock& clock, long long duration_ms, const std::atomic<bool>& running, long long slice_ms) {
    long long remaining_ms = duration_ms;
    while (remaining_ms > 0) {
        if (!running.load()) {
            return false;
        }
        const long long step_ms = std::min(remaining_ms, slice_ms);
        clock.sleep_for_milliseconds(step_ms);
        remaining_ms -= step_ms;
    }
    return running.load();
}

} // namespace BeanTrader
