#ifndef HISTORY_STORE_HPP
#define HISTORY_STORE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <optional>
#include <vector>
#include <cstddef>

namespace BeanTrader {
namespace Storage {

/**
 * Append-only market and trade history. The durable source of truth for
 * everything the bot has observed and done.
 */
class HistoryStoreInterface {
public:
    virtual ~HistoryStoreInterface() = default;

    // Throws std::runtime_error if the timestamp is lower than the latest stored snapshot's
    virtual void append_snapshot(const Core::MarketSnapshot& snapshot) = 0;
    virtual std::optional<Core::MarketSnapshot> latest_snapshot() const = 0;

    // Inclusive on both ends, ascending by timestamp
    virtual std::vector<Core::MarketSnapshot> snapshots_between(long long start_timestamp, long long end_timestamp) const = 0;

    virtual void append_trade(const Core::TradeRecord& trade) = 0;
    virtual std::vector<Core::TradeRecord> trades_between(long long start_timestamp, long long end_timestamp) const = 0;

    virtual size_t snapshot_count() const = 0;
};

} // namespace Storage
} // namespace BeanTrader

#endif // HISTORY_STORE_HPP
