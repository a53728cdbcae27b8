#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include "trader/analysis/summary_compiler.hpp"
#include "trader/analysis/threshold_calculator.hpp"
#include <string>

namespace BeanTrader {
namespace Logging {

/**
 * Cycle-level logging: market state, summaries, thresholds, decisions and
 * the outer loop's bookkeeping.
 */
class TradingLogs {
public:
    // Cycle lifecycle
    static void log_cycle_header(unsigned long cycle_number);
    static void log_cycle_complete(const std::string& status_description);
    static void log_cycle_skipped(const std::string& error_kind, const std::string& error_message);
    static void log_next_cycle(long long sleep_milliseconds);
    static void log_fatal_error(const std::string& error_message);

    // Synchronization
    static void log_market_state(const Core::MarketSnapshot& snapshot, bool history_appended);
    static void log_sync_rate_limited(const std::string& error_message);
    static void log_sync_failed(const std::string& error_message);
    static void log_clock_stepped_back(long long observed_timestamp, long long latest_timestamp);

    // Analysis and decision
    static void log_market_summaries(const Core::MarketSummaries& summaries);
    static void log_thresholds(const Core::TradeThresholds& thresholds);
    static void log_hold_reason(const std::string& reason);
    static void log_decision(const Core::TradeDecision& decision, long long price, const std::string& strategy_name);

    static std::string format_beans(long long amount);
    static std::string format_decimal(double value, int precision);

private:
    static void log_summary_row(const std::string& label, const Core::MarketSummary& summary);
};

} // namespace Logging
} // namespace BeanTrader

#endif // TRADING_LOGS_HPP
