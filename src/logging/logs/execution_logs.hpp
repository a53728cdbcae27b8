#ifndef EXECUTION_LOGS_HPP
#define EXECUTION_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include "trader/execution/trade_executor.hpp"
#include <string>

namespace BeanTrader {
namespace Logging {

// Chunked order execution progress, backoff and results
class ExecutionLogs {
public:
    static void log_execution_start(Core::TradeAction action, long long total_quantity, long long reference_price);
    static void log_throttle(int recent_calls, long long delay_milliseconds);
    static void log_chunk_attempt(Core::TradeAction action, long long chunk_quantity, long long remaining_after);
    static void log_chunk_filled(Core::TradeAction action, long long chunk_quantity, long long price, long long remaining_quantity);
    static void log_rate_limit_backoff(Core::TradeAction action, long long backoff_milliseconds, const std::string& error_message);
    static void log_backoff_interrupted(Core::TradeAction action, long long remaining_quantity);
    static void log_price_moved(long long reference_price, long long current_price);
    static void log_price_stable(long long current_price);
    static void log_recheck_failed(const std::string& error_message);
    static void log_request_failed(Core::TradeAction action, const std::string& error_message);
    static void log_final_price_unavailable(const std::string& error_message, long long fallback_price);
    static void log_trade_result(const Core::TradeResult& result);
};

} // namespace Logging
} // namespace BeanTrader

#endif // EXECUTION_LOGS_HPP
