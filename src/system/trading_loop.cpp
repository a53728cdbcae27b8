#include "trading_loop.hpp"
#include "api/request_errors.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

namespace BeanTrader {
namespace System {

using Logging::TradingLogs;

TradingLoop::TradingLoop(Core::TradingCycle& cycle, Clock& clock_ref,
                         const Config::TimingConfig& timing_cfg, std::atomic<bool>& running_flag)
    : trading_cycle(cycle), clock(clock_ref), timing_config(timing_cfg), running(running_flag) {}

long long TradingLoop::compute_sleep_milliseconds(long long cycle_elapsed_ms) const {
    const long long cycle_interval_ms = static_cast<long long>(timing_config.cycle_interval_sec) * TimeUtils::MILLISECONDS_PER_SECOND;
    return std::max(timing_config.min_cycle_sleep_ms, cycle_interval_ms - cycle_elapsed_ms);
}

int TradingLoop::run(unsigned long max_cycles) {
    unsigned long cycles_run = 0;

    while (running.load()) {
        const long long cycle_start_ms = clock.now_milliseconds();

        try {
            Core::CycleStatus status = trading_cycle.perform_cycle();
            TradingLogs::log_cycle_complete(Core::to_string(status));
        } catch (const API::RequestError& request_error) {
            TradingLogs::log_cycle_skipped(API::to_string(request_error.kind()), request_error.what());
        } catch (const std::exception& exception_error) {
            TradingLogs::log_fatal_error(exception_error.what());
            return 1;
        }

        cycles_run++;
        if (max_cycles > 0 && cycles_run >= max_cycles) {
            break;
        }
        if (!running.load()) {
            break;
        }

        const long long sleep_ms = compute_sleep_milliseconds(clock.now_milliseconds() - cycle_start_ms);
        TradingLogs::log_next_cycle(sleep_ms);
        sleep_while_running(clock, sleep_ms, running, STOP_CHECK_INTERVAL_MS);
    }

    return 0;
}

} // namespace System
} // namespace BeanTrader
