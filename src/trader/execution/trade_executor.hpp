#ifndef TRADE_EXECUTOR_HPP
#define TRADE_EXECUTOR_HPP

#include "api/market_api_interface.hpp"
#include "api/rate_tracker.hpp"
#include "configs/exchange_config.hpp"
#include "configs/execution_config.hpp"
#include "storage/history_store.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_state/market_state_cache.hpp"
#include "utils/clock.hpp"
#include <atomic>
#include <stdexcept>
#include <string>

namespace BeanTrader {
namespace Core {

// A buy chunk would cost more than the cached balance. Not a transport failure.
class InsufficientBalanceError : public std::runtime_error {
public:
    explicit InsufficientBalanceError(const std::string& message) : std::runtime_error(message) {}
};

// A sell chunk exceeds the cached holdings. Not a transport failure.
class InsufficientUnitsError : public std::runtime_error {
public:
    explicit InsufficientUnitsError(const std::string& message) : std::runtime_error(message) {}
};

enum class TradeTermination {
    Completed,        // Every unit filled
    PriceMoved,       // Price differed from the reference after a rate-limit backoff
    RequestFailed,    // Non rate-limit transport failure on a chunk
    RecheckFailed,    // Transport failure while re-reading the price after a backoff
    Interrupted       // Shutdown requested during a rate-limit backoff
};

std::string to_string(TradeTermination termination);

struct TradeResult {
    TradeAction action;
    long long total_quantity;
    long long remaining_quantity;
    long long reference_price;     // Price the decision was made against
    long long final_price;         // Cached price at the end, or the last observed one
    bool completed;                // remaining_quantity == 0
    int chunks_executed;
    TradeTermination termination;

    TradeResult()
        : action(TradeAction::Hold), total_quantity(0), remaining_quantity(0), reference_price(0),
          final_price(0), completed(false), chunks_executed(0), termination(TradeTermination::Completed) {}
};

/**
 * TradeExecutor - splits an order into chunks no larger than the exchange
 * allows and submits them one at a time.
 *
 * Throttles when the trailing-minute call count nears the budget, backs off
 * exponentially on rate limits and abandons the rest of the order once the
 * price has moved away from the reference. Confirmed chunks are never lost:
 * each one updates the cache and is appended to the trade history.
 */
class TradeExecutor {
public:
    struct Dependencies {
        API::MarketApiInterface& market_api;
        MarketStateCache& state_cache;
        Storage::HistoryStoreInterface& history_store;
        API::RateTracker& rate_tracker;
        Clock& clock;
        // Backoff sleeps are cut short once this clears. Null means never interrupted.
        const std::atomic<bool>* running = nullptr;
    };

    TradeExecutor(const Dependencies& dependencies,
                  const Config::ExchangeConfig& exchange_config,
                  const Config::ExecutionConfig& execution_config);

    // Throws std::invalid_argument for Hold or a non-positive quantity
    TradeResult execute_trade(TradeAction action, long long total_quantity, long long reference_price);

private:
    API::MarketApiInterface& market_api;
    MarketStateCache& state_cache;
    Storage::HistoryStoreInterface& history_store;
    API::RateTracker& rate_tracker;
    Clock& clock;
    const std::atomic<bool>* running;
    const Config::ExchangeConfig& exchange_config;
    const Config::ExecutionConfig& execution_config;

    void throttle_if_near_limit();
    bool backoff(long long backoff_ms);

    // Returns the price the chunk was valued at
    long long execute_chunk(TradeAction action, long long chunk_quantity);
    long long read_final_price(long long last_observed_price);
};

} // namespace Core
} // namespace BeanTrader

#endif // TRADE_EXECUTOR_HPP
