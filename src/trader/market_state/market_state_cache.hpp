#ifndef MARKET_STATE_CACHE_HPP
#define MARKET_STATE_CACHE_HPP

#include "api/market_api_interface.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "utils/clock.hpp"

namespace BeanTrader {
namespace Core {

/**
 * MarketStateCache - locally cached price, holdings and balance.
 *
 * Getters fetch a slot only when it is empty. The cache may drift from the
 * remote state after optimistic updates; synchronize() and refresh_price()
 * restore ground truth.
 */
class MarketStateCache {
public:
    MarketStateCache(API::MarketApiInterface& market_api, const Clock& clock);

    long long get_price();
    long long get_owned_units();
    long long get_balance();

    // Fetches all three slots (price, owned units, balance in that order) and stamps the sync time
    MarketSnapshot synchronize();

    // Single ground-truth price read; overwrites the cached price
    long long refresh_price();

    // Optimistic post-trade arithmetic: units * price moves between balance and holdings
    void apply_fill(TradeAction action, long long units, long long price);

    void invalidate();
    CachedState state() const { return cached_state; }

private:
    API::MarketApiInterface& market_api;
    const Clock& clock;
    CachedState cached_state;
};

} // namespace Core
} // namespace BeanTrader

#endif // MARKET_STATE_CACHE_HPP
