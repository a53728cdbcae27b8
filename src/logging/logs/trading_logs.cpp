#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace BeanTrader {
namespace Logging {

std::string TradingLogs::format_beans(long long amount) {
    return std::to_string(amount) + " beans";
}

std::string TradingLogs::format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void TradingLogs::log_cycle_header(unsigned long cycle_number) {
    LOG_TRADING_CYCLE_HEADER(cycle_number);
    log_message("Cycle started at " + TimeUtils::get_current_iso_time_with_z(), "");
}

void TradingLogs::log_cycle_complete(const std::string& status_description) {
    log_message("Cycle finished: " + status_description, "");
}

void TradingLogs::log_cycle_skipped(const std::string& error_kind, const std::string& error_message) {
    log_message("Cycle skipped (" + error_kind + "): " + error_message, "");
}

void TradingLogs::log_next_cycle(long long sleep_milliseconds) {
    log_message("Next cycle in " + TimeUtils::format_duration_milliseconds(sleep_milliseconds), "");
}

void TradingLogs::log_fatal_error(const std::string& error_message) {
    LOG_THREAD_SECTION_HEADER("FATAL ERROR");
    LOG_THREAD_CONTENT(error_message);
    LOG_THREAD_CONTENT("Trading loop terminated");
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_market_state(const Core::MarketSnapshot& snapshot, bool history_appended) {
    LOG_THREAD_MARKET_STATE_HEADER();
    LOG_THREAD_CONTENT("Synced at: " + TimeUtils::convert_milliseconds_to_human_readable(snapshot.timestamp));
    LOG_THREAD_CONTENT("Price: " + format_beans(snapshot.price));
    LOG_THREAD_CONTENT("Owned units: " + std::to_string(snapshot.owned_units));
    LOG_THREAD_CONTENT("Balance: " + format_beans(snapshot.balance));
    LOG_THREAD_CONTENT(history_appended ? "History: price changed, snapshot recorded" : "History: price unchanged");
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_sync_rate_limited(const std::string& error_message) {
    log_message("Rate limit hit during synchronization, skipping cycle", "");
    log_debug(error_message);
}

void TradingLogs::log_sync_failed(const std::string& error_message) {
    log_message("Request error during synchronization: " + error_message, "");
}

void TradingLogs::log_clock_stepped_back(long long observed_timestamp, long long latest_timestamp) {
    log_message("Clock is behind the latest snapshot (" + std::to_string(observed_timestamp) + " < " +
                std::to_string(latest_timestamp) + "), recording at the latest timestamp", "");
}

void TradingLogs::log_summary_row(const std::string& label, const Core::MarketSummary& summary) {
    if (summary.entry_count == 0) {
        TABLE_ROW_30(label, "no data");
        return;
    }
    std::ostringstream oss;
    oss << "n=" << summary.entry_count
        << " avg=" << format_decimal(summary.mean_price, 1)
        << " sd=" << format_decimal(summary.sample_std_dev, 1)
        << " " << summary.min_price << "-" << summary.max_price;
    TABLE_ROW_30(label, oss.str());
}

void TradingLogs::log_market_summaries(const Core::MarketSummaries& summaries) {
    LOG_THREAD_MARKET_SUMMARY_HEADER();
    TABLE_HEADER_30("Window", "Statistics");
    log_summary_row("Last 1h", summaries.last_1h);
    log_summary_row("Last 12h", summaries.last_12h);
    log_summary_row("Last 1d", summaries.last_1d);
    log_summary_row("Last 1w", summaries.last_1w);
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_thresholds(const Core::TradeThresholds& thresholds) {
    log_message("Thresholds: buy < " + std::to_string(thresholds.buy_threshold) +
                ", sell > " + std::to_string(thresholds.sell_threshold) +
                (thresholds.is_valid ? "" : " (invalid)"), "");
}

void TradingLogs::log_hold_reason(const std::string& reason) {
    log_message("Holding: " + reason, "");
}

void TradingLogs::log_decision(const Core::TradeDecision& decision, long long price, const std::string& strategy_name) {
    LOG_THREAD_DECISION_HEADER();
    LOG_THREAD_CONTENT("Strategy: " + strategy_name);
    if (decision.is_hold()) {
        LOG_THREAD_CONTENT("Action: hold");
    } else {
        LOG_THREAD_CONTENT("Action: " + Core::to_string(decision.action) + " " + std::to_string(decision.quantity) +
                           " units at " + format_beans(price));
    }
    LOG_THREAD_SECTION_FOOTER();
}

} // namespace Logging
} // namespace BeanTrader
