#ifndef RATE_TRACKER_HPP
#define RATE_TRACKER_HPP

#include "utils/clock.hpp"
#include <deque>

namespace BeanTrader {
namespace API {

/**
 * RateTracker - counts outbound calls over the trailing minute.
 *
 * Process-local; every request issued by the exchange client is recorded once,
 * whether it succeeded or not.
 */
class RateTracker {
public:
    static constexpr long long WINDOW_MILLISECONDS = 60 * 1000;

    explicit RateTracker(const Clock& clock_ref);

    void record_call();

    // Discards entries older than the window, then returns how many remain
    int count_recent_calls();

private:
    const Clock& clock;
    std::deque<long long> call_timestamps;

    void discard_expired_calls(long long now_milliseconds);
};

} // namespace API
} // namespace BeanTrader

#endif // RATE_TRACKER_HPP
