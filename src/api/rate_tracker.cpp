#include "rate_tracker.hpp"

namespace BeanTrader {
namespace API {

RateTracker::RateTracker(const Clock& clock_ref) : clock(clock_ref) {}

void RateTracker::record_call() {
    call_timestamps.push_back(clock.now_milliseconds());
}

int RateTracker::count_recent_calls() {
    discard_expired_calls(clock.now_milliseconds());
    return static_cast<int>(call_timestamps.size());
}

void RateTracker::discard_expired_calls(long long now_milliseconds) {
    const long long window_start = now_milliseconds - WINDOW_MILLISECONDS;
    // Timestamps are appended in order, so expired entries sit at the front
    while (!call_timestamps.empty() && call_timestamps.front() < window_start) {
        call_timestamps.pop_front();
    }
}

} // namespace API
} // namespace BeanTrader
