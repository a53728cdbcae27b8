#ifndef TRADING_CYCLE_HPP
#define TRADING_CYCLE_HPP

#include "trader/market_state/market_state_cache.hpp"
#include "trader/market_state/market_history.hpp"
#include "trader/strategy/decision_strategy.hpp"
#include "trader/execution/trade_executor.hpp"
#include "storage/history_store.hpp"
#include "utils/clock.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace BeanTrader {
namespace Core {

enum class CycleStatus {
    Traded,               // Order fully filled
    TradeIncomplete,      // Order aborted with units remaining (partial fill stands)
    Held,                 // No trade this cycle
    SkippedRateLimited    // Synchronization was rate limited
};

std::string to_string(CycleStatus status);

/**
 * TradingCycle - one synchronize, summarize, decide, execute pass.
 *
 * Synchronization failures: a rate limit skips the cycle, any other request
 * failure is logged and rethrown. Cycles are serialized by an internal mutex.
 */
class TradingCycle {
public:
    struct Dependencies {
        MarketStateCache& state_cache;
        MarketHistory& market_history;
        Storage::HistoryStoreInterface& history_store;
        const DecisionStrategy& decision_strategy;
        TradeExecutor& trade_executor;
        const Clock& clock;
    };

    explicit TradingCycle(const Dependencies& dependencies);

    CycleStatus perform_cycle();

    unsigned long get_cycle_count() const { return cycle_count; }
    const std::optional<TradeResult>& get_last_trade_result() const { return last_trade_result; }

private:
    MarketStateCache& state_cache;
    MarketHistory& market_history;
    Storage::HistoryStoreInterface& history_store;
    const DecisionStrategy& decision_strategy;
    TradeExecutor& trade_executor;
    const Clock& clock;

    std::mutex cycle_mutex;
    unsigned long cycle_count;
    std::optional<TradeResult> last_trade_result;
};

} // namespace Core
} // namespace BeanTrader

#endif // TRADING_CYCLE_HPP
