#include "execution_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"

namespace BeanTrader {
namespace Logging {

namespace {

std::string past_tense(Core::TradeAction action) {
    return action == Core::TradeAction::Buy ? "bought" : "sold";
}

} // namespace

void ExecutionLogs::log_execution_start(Core::TradeAction action, long long total_quantity, long long reference_price) {
    LOG_THREAD_ORDER_EXECUTION_HEADER();
    LOG_THREAD_CONTENT("Executing " + Core::to_string(action) + " order for " + std::to_string(total_quantity) +
                       " units (reference price " + std::to_string(reference_price) + ")");
}

void ExecutionLogs::log_throttle(int recent_calls, long long delay_milliseconds) {
    LOG_THREAD_CONTENT("Nearing rate limit (" + std::to_string(recent_calls) + " calls in last minute), pausing " +
                       TimeUtils::format_duration_milliseconds(delay_milliseconds));
}

void ExecutionLogs::log_chunk_attempt(Core::TradeAction action, long long chunk_quantity, long long remaining_after) {
    log_debug("attempting to " + Core::to_string(action) + " chunk of " + std::to_string(chunk_quantity) +
              " units (remaining after: " + std::to_string(remaining_after) + ")");
}

void ExecutionLogs::log_chunk_filled(Core::TradeAction action, long long chunk_quantity, long long price, long long remaining_quantity) {
    LOG_THREAD_SUBCONTENT(past_tense(action) + " " + std::to_string(chunk_quantity) + " units at " + std::to_string(price) +
                          ", " + std::to_string(remaining_quantity) + " remaining");
}

void ExecutionLogs::log_rate_limit_backoff(Core::TradeAction action, long long backoff_milliseconds, const std::string& error_message) {
    LOG_THREAD_CONTENT("Rate limit hit during " + Core::to_string(action) + " chunk, backing off for " +
                       TimeUtils::format_duration_milliseconds(backoff_milliseconds));
    log_debug(error_message);
}

void ExecutionLogs::log_backoff_interrupted(Core::TradeAction action, long long remaining_quantity) {
    LOG_THREAD_CONTENT("Shutdown requested during backoff, abandoning " + std::to_string(remaining_quantity) +
                       " units of " + Core::to_string(action) + " order");
}

void ExecutionLogs::log_price_moved(long long reference_price, long long current_price) {
    LOG_THREAD_CONTENT("Price changed to " + std::to_string(current_price) + " (was " + std::to_string(reference_price) +
                       ") after rate limit, aborting order");
}

void ExecutionLogs::log_price_stable(long long current_price) {
    LOG_THREAD_CONTENT("Price stable at " + std::to_string(current_price) + ", retrying chunk");
}

void ExecutionLogs::log_recheck_failed(const std::string& error_message) {
    LOG_THREAD_CONTENT("Price re-check after rate limit failed, aborting order: " + error_message);
}

void ExecutionLogs::log_request_failed(Core::TradeAction action, const std::string& error_message) {
    LOG_THREAD_CONTENT("Request error during " + Core::to_string(action) + " chunk, aborting order: " + error_message);
}

void ExecutionLogs::log_final_price_unavailable(const std::string& error_message, long long fallback_price) {
    LOG_THREAD_CONTENT("Final price read failed, using last observed price " + std::to_string(fallback_price) + ": " + error_message);
}

void ExecutionLogs::log_trade_result(const Core::TradeResult& result) {
    TABLE_HEADER_30("Order", Core::to_string(result.action));
    TABLE_ROW_30("Requested", std::to_string(result.total_quantity));
    TABLE_ROW_30("Filled", std::to_string(result.total_quantity - result.remaining_quantity));
    TABLE_ROW_30("Remaining", std::to_string(result.remaining_quantity));
    TABLE_ROW_30("Chunks", std::to_string(result.chunks_executed));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Reference price", std::to_string(result.reference_price));
    TABLE_ROW_30("Final price", std::to_string(result.final_price));
    TABLE_ROW_30("Outcome", Core::to_string(result.termination));
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

} // namespace Logging
} // namespace BeanTrader
