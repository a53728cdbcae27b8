#ifndef TRADING_LOOP_HPP
#define TRADING_LOOP_HPP

#include "trader/trading_cycle.hpp"
#include "configs/timing_config.hpp"
#include "utils/clock.hpp"
#include <atomic>

namespace BeanTrader {
namespace System {

/**
 * TradingLoop - runs trading cycles until shutdown.
 *
 * After each cycle sleeps max(min_cycle_sleep, cycle_interval - elapsed).
 * Request failures raised out of a cycle skip that cycle; anything else ends
 * the loop with a non-zero exit code. The sleep is sliced so a cleared
 * running flag is noticed promptly.
 */
class TradingLoop {
public:
    static constexpr long long STOP_CHECK_INTERVAL_MS = BeanTrader::STOP_CHECK_INTERVAL_MS;

    TradingLoop(Core::TradingCycle& trading_cycle, Clock& clock,
                const Config::TimingConfig& timing_config, std::atomic<bool>& running);

    // Returns the process exit code. max_cycles of 0 runs until the running flag clears.
    int run(unsigned long max_cycles = 0);

    long long compute_sleep_milliseconds(long long cycle_elapsed_ms) const;

private:
    Core::TradingCycle& trading_cycle;
    Clock& clock;
    const Config::TimingConfig& timing_config;
    std::atomic<bool>& running;
};

} // namespace System
} // namespace BeanTrader

#endif // TRADING_LOOP_HPP
