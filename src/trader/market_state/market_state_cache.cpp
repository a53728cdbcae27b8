#include "market_state_cache.hpp"
#include <stdexcept>

namespace BeanTrader {
namespace Core {

MarketStateCache::MarketStateCache(API::MarketApiInterface& market_api_ref, const Clock& clock_ref)
    : market_api(market_api_ref), clock(clock_ref) {}

long long MarketStateCache::get_price() {
    if (!cached_state.price) {
        cached_state.price = market_api.fetch_price();
    }
    return *cached_state.price;
}

long long MarketStateCache::get_owned_units() {
    if (!cached_state.owned_units) {
        cached_state.owned_units = market_api.fetch_owned_units();
    }
    return *cached_state.owned_units;
}

long long MarketStateCache::get_balance() {
    if (!cached_state.balance) {
        cached_state.balance = market_api.fetch_balance();
    }
    return *cached_state.balance;
}

MarketSnapshot MarketStateCache::synchronize() {
    long long current_price = market_api.fetch_price();
    long long current_owned_units = market_api.fetch_owned_units();
    long long current_balance = market_api.fetch_balance();

    long long sync_timestamp = clock.now_milliseconds();

    cached_state.price = current_price;
    cached_state.owned_units = current_owned_units;
    cached_state.balance = current_balance;
    cached_state.last_sync_timestamp = sync_timestamp;

    return MarketSnapshot(sync_timestamp, current_price, current_owned_units, current_balance);
}

long long MarketStateCache::refresh_price() {
    cached_state.price = market_api.fetch_price();
    return *cached_state.price;
}

void MarketStateCache::apply_fill(TradeAction action, long long units, long long price) {
    if (action == TradeAction::Hold || units <= 0) {
        return;
    }

    long long owned_units = get_owned_units();
    long long balance = get_balance();
    long long fill_value = units * price;

    if (action == TradeAction::Buy) {
        cached_state.owned_units = owned_units + units;
        cached_state.balance = balance - fill_value;
    } else {
        if (units > owned_units) {
            throw std::runtime_error("Cannot apply sell of " + std::to_string(units) +
                                     " units with only " + std::to_string(owned_units) + " owned");
        }
        cached_state.owned_units = owned_units - units;
        cached_state.balance = balance + fill_value;
    }
}

void MarketStateCache::invalidate() {
    cached_state = CachedState();
}

} // namespace Core
} // namespace BeanTrader
