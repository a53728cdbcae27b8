#include "market_history.hpp"
#include "logging/logs/trading_logs.hpp"

namespace BeanTrader {
namespace Core {

MarketHistory::MarketHistory(Storage::HistoryStoreInterface& store) : history_store(store) {}

RecordedSnapshot MarketHistory::record_if_changed(const MarketSnapshot& snapshot) {
    std::optional<MarketSnapshot> previous_snapshot = history_store.latest_snapshot();

    if (previous_snapshot && previous_snapshot->price == snapshot.price) {
        return RecordedSnapshot(*previous_snapshot, false);
    }

    // The store only accepts non-decreasing timestamps; a clock stepping back keeps the latest one
    MarketSnapshot stored_snapshot = snapshot;
    if (previous_snapshot && stored_snapshot.timestamp < previous_snapshot->timestamp) {
        Logging::TradingLogs::log_clock_stepped_back(snapshot.timestamp, previous_snapshot->timestamp);
        stored_snapshot.timestamp = previous_snapshot->timestamp;
    }

    history_store.append_snapshot(stored_snapshot);
    return RecordedSnapshot(stored_snapshot, true);
}

} // namespace Core
} // namespace BeanTrader
