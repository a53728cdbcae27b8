#include "trade_executor.hpp"
#include "api/request_errors.hpp"
#include "logging/logs/execution_logs.hpp"
#include <algorithm>

namespace BeanTrader {
namespace Core {

using Logging::ExecutionLogs;

std::string to_string(TradeTermination termination) {
    switch (termination) {
        case TradeTermination::Completed: return "completed";
        case TradeTermination::PriceMoved: return "price moved";
        case TradeTermination::RequestFailed: return "request failed";
        case TradeTermination::RecheckFailed: return "price re-check failed";
        case TradeTermination::Interrupted: return "interrupted by shutdown";
    }
    return "unknown";
}

TradeExecutor::TradeExecutor(const Dependencies& dependencies,
                             const Config::ExchangeConfig& exchange_cfg,
                             const Config::ExecutionConfig& execution_cfg)
    : market_api(dependencies.market_api),
      state_cache(dependencies.state_cache),
      history_store(dependencies.history_store),
      rate_tracker(dependencies.rate_tracker),
      clock(dependencies.clock),
      running(dependencies.running),
      exchange_config(exchange_cfg),
      execution_config(execution_cfg) {}

TradeResult TradeExecutor::execute_trade(TradeAction action, long long total_quantity, long long reference_price) {
    if (action == TradeAction::Hold) {
        throw std::invalid_argument("Cannot execute a hold decision");
    }
    if (total_quantity <= 0) {
        throw std::invalid_argument("Trade quantity must be positive, got " + std::to_string(total_quantity));
    }

    ExecutionLogs::log_execution_start(action, total_quantity, reference_price);

    TradeResult result;
    result.action = action;
    result.total_quantity = total_quantity;
    result.remaining_quantity = total_quantity;
    result.reference_price = reference_price;

    long long current_backoff_ms = execution_config.initial_backoff_ms;
    long long last_observed_price = reference_price;

    while (result.remaining_quantity > 0) {
        throttle_if_near_limit();

        const long long chunk_quantity = std::min<long long>(result.remaining_quantity, exchange_config.max_units_per_chunk);

        try {
            ExecutionLogs::log_chunk_attempt(action, chunk_quantity, result.remaining_quantity - chunk_quantity);

            last_observed_price = execute_chunk(action, chunk_quantity);

            result.remaining_quantity -= chunk_quantity;
            result.chunks_executed++;
            current_backoff_ms = execution_config.initial_backoff_ms;

            ExecutionLogs::log_chunk_filled(action, chunk_quantity, last_observed_price, result.remaining_quantity);

            if (result.remaining_quantity > 0 && execution_config.inter_chunk_delay_ms > 0) {
                clock.sleep_for_milliseconds(execution_config.inter_chunk_delay_ms);
            }
        } catch (const API::RateLimitError& rate_limit_error) {
            ExecutionLogs::log_rate_limit_backoff(action, current_backoff_ms, rate_limit_error.what());

            if (!backoff(current_backoff_ms)) {
                ExecutionLogs::log_backoff_interrupted(action, result.remaining_quantity);
                result.termination = TradeTermination::Interrupted;
                break;
            }
            current_backoff_ms = std::min(current_backoff_ms * 2, execution_config.max_backoff_ms);

            long long rechecked_price = 0;
            try {
                rechecked_price = state_cache.refresh_price();
            } catch (const API::RequestError& recheck_error) {
                ExecutionLogs::log_recheck_failed(recheck_error.what());
                result.termination = TradeTermination::RecheckFailed;
                break;
            }
            last_observed_price = rechecked_price;

            if (rechecked_price != reference_price) {
                ExecutionLogs::log_price_moved(reference_price, rechecked_price);
                result.termination = TradeTermination::PriceMoved;
                break;
            }
            ExecutionLogs::log_price_stable(rechecked_price);
        } catch (const API::RequestError& request_error) {
            ExecutionLogs::log_request_failed(action, request_error.what());
            result.termination = TradeTermination::RequestFailed;
            break;
        }
    }

    result.completed = result.remaining_quantity == 0;
    if (result.completed) {
        result.termination = TradeTermination::Completed;
    }
    result.final_price = read_final_price(last_observed_price);

    ExecutionLogs::log_trade_result(result);
    return result;
}

void TradeExecutor::throttle_if_near_limit() {
    const int recent_calls = rate_tracker.count_recent_calls();
    if (recent_calls >= exchange_config.max_calls_per_minute - execution_config.throttle_margin) {
        ExecutionLogs::log_throttle(recent_calls, execution_config.throttle_delay_ms);
        clock.sleep_for_milliseconds(execution_config.throttle_delay_ms);
    }
}

// Returns false when shutdown was requested before the backoff finished
bool TradeExecutor::backoff(long long backoff_ms) {
    if (running == nullptr) {
        clock.sleep_for_milliseconds(backoff_ms);
        return true;
    }
    return sleep_while_running(clock, backoff_ms, *running);
}

long long TradeExecutor::execute_chunk(TradeAction action, long long chunk_quantity) {
    TradeRecord trade;
    trade.balance_before = state_cache.get_balance();
    trade.price = state_cache.get_price();
    trade.owned_units_before = state_cache.get_owned_units();

    if (action == TradeAction::Buy) {
        const long long chunk_cost = chunk_quantity * trade.price;
        if (chunk_cost > trade.balance_before) {
            throw InsufficientBalanceError("Not enough beans to buy " + std::to_string(chunk_quantity) + " units at " +
                                           std::to_string(trade.price) + " (cost " + std::to_string(chunk_cost) +
                                           ", balance " + std::to_string(trade.balance_before) + ")");
        }
        market_api.submit_buy(chunk_quantity);
        trade.units_bought = chunk_quantity;
    } else {
        if (chunk_quantity > trade.owned_units_before) {
            throw InsufficientUnitsError("Cannot sell " + std::to_string(chunk_quantity) + " units with only " +
                                         std::to_string(trade.owned_units_before) + " owned");
        }
        market_api.submit_sell(chunk_quantity);
        trade.units_sold = chunk_quantity;
    }

    state_cache.apply_fill(action, chunk_quantity, trade.price);

    trade.balance_after = state_cache.get_balance();
    trade.timestamp = clock.now_milliseconds();
    history_store.append_trade(trade);

    return trade.price;
}

long long TradeExecutor::read_final_price(long long last_observed_price) {
    try {
        return state_cache.get_price();
    } catch (const API::RequestError& price_error) {
        ExecutionLogs::log_final_price_unavailable(price_error.what(), last_observed_price);
        return last_observed_price;
    }
}

} // namespace Core
} // namespace BeanTrader
