#ifndef CSV_HISTORY_STORE_HPP
#define CSV_HISTORY_STORE_HPP

#include "history_store.hpp"
#include "configs/storage_config.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace BeanTrader {
namespace Storage {

/**
 * CsvHistoryStore - history.csv and trades.csv in the data directory.
 *
 * Existing rows are loaded into memory on construction and kept sorted by
 * timestamp; range queries binary-search the in-memory copy. Every append is
 * written and flushed before it becomes visible to queries.
 */
class CsvHistoryStore : public HistoryStoreInterface {
public:
    explicit CsvHistoryStore(const Config::StorageConfig& storage_config);
    ~CsvHistoryStore() override;

    CsvHistoryStore(const CsvHistoryStore&) = delete;
    CsvHistoryStore& operator=(const CsvHistoryStore&) = delete;

    void append_snapshot(const Core::MarketSnapshot& snapshot) override;
    std::optional<Core::MarketSnapshot> latest_snapshot() const override;
    std::vector<Core::MarketSnapshot> snapshots_between(long long start_timestamp, long long end_timestamp) const override;

    void append_trade(const Core::TradeRecord& trade) override;
    std::vector<Core::TradeRecord> trades_between(long long start_timestamp, long long end_timestamp) const override;

    size_t snapshot_count() const override;
    size_t trade_count() const;

    const std::string& get_history_file_path() const { return history_file_path; }
    const std::string& get_trade_file_path() const { return trade_file_path; }

    static const char* const HISTORY_HEADER;
    static const char* const TRADE_HEADER;

private:
    std::string history_file_path;
    std::string trade_file_path;
    std::ofstream history_stream;
    std::ofstream trade_stream;
    mutable std::mutex store_mutex;

    std::vector<Core::MarketSnapshot> snapshots;
    std::vector<Core::TradeRecord> trades;

    void load_snapshots();
    void load_trades();
    void open_for_append(std::ofstream& file_stream, const std::string& file_path, const char* header);
};

} // namespace Storage
} // namespace BeanTrader

#endif // CSV_HISTORY_STORE_HPP
