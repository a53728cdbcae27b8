#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <atomic>

namespace BeanTrader {

/**
 * Clock - source of wall-clock time and the only place the engine blocks.
 *
 * Every deliberate wait (throttle, inter-chunk pacing, backoff, outer loop)
 * goes through sleep_for_milliseconds so tests can substitute simulated time.
 */
class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds since the Unix epoch
    virtual long long now_milliseconds() const = 0;
    virtual void sleep_for_milliseconds(long long duration_milliseconds) = 0;
};

class SystemClock : public Clock {
public:
    long long now_milliseconds() const override;
    void sleep_for_milliseconds(long long duration_milliseconds) override;
};

constexpr long long STOP_CHECK_INTERVAL_MS = 250;

// Sleeps in slices of at most slice_ms, returning false as soon as running clears
bool sleep_while_running(Clock& clock, long long duration_ms, const std::atomic<bool>& running,
                         long long slice_ms = STOP_CHECK_INTERVAL_MS);

} // namespace BeanTrader

#endif // CLOCK_HPP
