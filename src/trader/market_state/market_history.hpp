#ifndef MARKET_HISTORY_HPP
#define MARKET_HISTORY_HPP

#include "storage/history_store.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace BeanTrader {
namespace Core {

struct RecordedSnapshot {
    MarketSnapshot snapshot;   // The appended snapshot, or the unchanged prior one
    bool appended;

    RecordedSnapshot() : appended(false) {}
    RecordedSnapshot(const MarketSnapshot& snapshot_value, bool appended_value)
        : snapshot(snapshot_value), appended(appended_value) {}
};

// Deduplicating front of the history store: a snapshot is kept only when the price moved.
class MarketHistory {
public:
    explicit MarketHistory(Storage::HistoryStoreInterface& history_store);

    RecordedSnapshot record_if_changed(const MarketSnapshot& snapshot);

private:
    Storage::HistoryStoreInterface& history_store;
};

} // namespace Core
} // namespace BeanTrader

#endif // MARKET_HISTORY_HPP
