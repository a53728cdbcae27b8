#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <optional>

namespace BeanTrader {
namespace Core {

// All prices and balances are whole beans; all quantities are whole units.

// Market state at one instant. Persisted only when the price changes.
struct MarketSnapshot {
    long long timestamp;       // Milliseconds since the Unix epoch
    long long price;
    long long owned_units;
    long long balance;

    MarketSnapshot() : timestamp(0), price(0), owned_units(0), balance(0) {}
    MarketSnapshot(long long timestamp_value, long long price_value, long long owned_value, long long balance_value)
        : timestamp(timestamp_value), price(price_value), owned_units(owned_value), balance(balance_value) {}
};

// One confirmed chunk of an order. Exactly one of units_bought / units_sold is non-zero.
struct TradeRecord {
    long long timestamp;
    long long price;                  // Price used for the chunk
    long long owned_units_before;
    long long units_bought;
    long long units_sold;
    long long balance_before;
    long long balance_after;

    TradeRecord()
        : timestamp(0), price(0), owned_units_before(0), units_bought(0), units_sold(0),
          balance_before(0), balance_after(0) {}
};

// Locally cached copy of the remote state, to save on requests
struct CachedState {
    std::optional<long long> price;
    std::optional<long long> owned_units;
    std::optional<long long> balance;
    std::optional<long long> last_sync_timestamp;   // Unset until the first full synchronization
};

enum class TradeAction { Buy, Sell, Hold };

inline std::string to_string(TradeAction action) {
    switch (action) {
        case TradeAction::Buy: return "buy";
        case TradeAction::Sell: return "sell";
        case TradeAction::Hold: return "hold";
    }
    return "unknown";
}

// Quantity is 0 for Hold and strictly positive otherwise
struct TradeDecision {
    TradeAction action;
    long long quantity;

    TradeDecision() : action(TradeAction::Hold), quantity(0) {}
    TradeDecision(TradeAction action_value, long long quantity_value) : action(action_value), quantity(quantity_value) {}

    bool is_hold() const { return action == TradeAction::Hold; }
};

} // namespace Core
} // namespace BeanTrader

#endif // DATA_STRUCTURES_HPP
