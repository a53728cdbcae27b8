#include "trading_cycle.hpp"
#include "api/request_errors.hpp"
#include "logging/logs/trading_logs.hpp"

namespace BeanTrader {
namespace Core {

using Logging::TradingLogs;

std::string to_string(CycleStatus status) {
    switch (status) {
        case CycleStatus::Traded: return "traded";
        case CycleStatus::TradeIncomplete: return "trade incomplete";
        case CycleStatus::Held: return "held";
        case CycleStatus::SkippedRateLimited: return "skipped (rate limited)";
    }
    return "unknown";
}

TradingCycle::TradingCycle(const Dependencies& dependencies)
    : state_cache(dependencies.state_cache),
      market_history(dependencies.market_history),
      history_store(dependencies.history_store),
      decision_strategy(dependencies.decision_strategy),
      trade_executor(dependencies.trade_executor),
      clock(dependencies.clock),
      cycle_count(0) {}

CycleStatus TradingCycle::perform_cycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex);

    cycle_count++;
    last_trade_result.reset();
    TradingLogs::log_cycle_header(cycle_count);

    MarketSnapshot current_snapshot;
    MarketSummaries current_summaries;

    try {
        current_snapshot = state_cache.synchronize();
        RecordedSnapshot recorded = market_history.record_if_changed(current_snapshot);
        TradingLogs::log_market_state(current_snapshot, recorded.appended);

        current_summaries = compile_market_summaries(history_store, clock.now_milliseconds());
    } catch (const API::RateLimitError& rate_limit_error) {
        TradingLogs::log_sync_rate_limited(rate_limit_error.what());
        return CycleStatus::SkippedRateLimited;
    } catch (const API::RequestError& request_error) {
        TradingLogs::log_sync_failed(request_error.what());
        throw;
    }

    TradingLogs::log_market_summaries(current_summaries);

    TradeDecision decision = decision_strategy.decide(DecisionContext(current_snapshot, current_summaries));
    TradingLogs::log_decision(decision, current_snapshot.price, decision_strategy.get_strategy_name());

    if (decision.is_hold()) {
        return CycleStatus::Held;
    }

    TradeResult trade_result = trade_executor.execute_trade(decision.action, decision.quantity, current_snapshot.price);
    last_trade_result = trade_result;

    return trade_result.completed ? CycleStatus::Traded : CycleStatus::TradeIncomplete;
}

} // namespace Core
} // namespace BeanTrader
