#include "csv_history_store.hpp"
#include "logging/logger/async_logger.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace BeanTrader {
namespace Storage {

using Core::MarketSnapshot;
using Core::TradeRecord;

const char* const CsvHistoryStore::HISTORY_HEADER = "timestamp,price,owned_units,balance";
const char* const CsvHistoryStore::TRADE_HEADER =
    "timestamp,price,owned_units_before,units_bought,units_sold,balance_before,balance_after";

namespace {

std::vector<long long> parse_csv_row(const std::string& line, size_t expected_fields,
                                     const std::string& file_path, size_t line_number) {
    std::vector<long long> values;
    std::stringstream line_stream(line);
    std::string field;

    while (std::getline(line_stream, field, ',')) {
        try {
            size_t parsed_length = 0;
            long long value = std::stoll(field, &parsed_length);
            if (parsed_length != field.size()) {
                throw std::invalid_argument("trailing characters");
            }
            values.push_back(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Corrupt row in " + file_path + " at line " + std::to_string(line_number) +
                                     ": invalid field '" + field + "'");
        }
    }

    if (values.size() != expected_fields || (!line.empty() && line.back() == ',')) {
        throw std::runtime_error("Corrupt row in " + file_path + " at line " + std::to_string(line_number) +
                                 ": expected " + std::to_string(expected_fields) + " fields");
    }
    return values;
}

struct CsvLine {
    std::string text;
    size_t line_number;
    std::uintmax_t start_offset;
    bool terminated;
};

std::vector<CsvLine> split_csv_lines(const std::string& content) {
    std::vector<CsvLine> lines;
    size_t line_start = 0;
    while (line_start < content.size()) {
        const size_t newline_position = content.find('\n', line_start);
        CsvLine line;
        line.line_number = lines.size() + 1;
        line.start_offset = line_start;
        line.terminated = newline_position != std::string::npos;
        const size_t line_end = line.terminated ? newline_position : content.size();
        line.text = content.substr(line_start, line_end - line_start);
        if (!line.text.empty() && line.text.back() == '\r') {
            line.text.pop_back();
        }
        lines.push_back(line);
        line_start = line_end + 1;
    }
    return lines;
}

// Cuts the file back to the start of a row left behind by an interrupted append
void discard_torn_row(const std::string& file_path, const CsvLine& line, const std::string& reason) {
    Logging::log_message("Discarding incomplete last row in " + file_path + " at line " +
                         std::to_string(line.line_number) + ": " + reason, "");

    std::error_code resize_error;
    std::filesystem::resize_file(file_path, line.start_offset, resize_error);
    if (resize_error) {
        throw std::runtime_error("Failed to truncate " + file_path + ": " + resize_error.message());
    }
}

// Calls row_handler for every data row; verifies the header when the file has content.
// A bad row is tolerated only at the very end of the file, where it is truncated away.
template <typename RowHandler>
void read_csv_file(const std::string& file_path, const char* expected_header, RowHandler row_handler) {
    std::ifstream input_stream(file_path, std::ios::binary);
    if (!input_stream.is_open()) {
        return;
    }
    std::ostringstream content_stream;
    content_stream << input_stream.rdbuf();
    input_stream.close();

    const std::vector<CsvLine> lines = split_csv_lines(content_stream.str());
    for (size_t index = 0; index < lines.size(); index++) {
        const CsvLine& line = lines[index];
        const bool is_last_line = index + 1 == lines.size();

        if (line.line_number == 1) {
            const std::string header(expected_header);
            if (line.terminated && line.text == header) {
                continue;
            }
            if (is_last_line && !line.terminated && header.compare(0, line.text.size(), line.text) == 0) {
                discard_torn_row(file_path, line, "header was not completed");
                return;
            }
            throw std::runtime_error("Unexpected header in " + file_path + " at line 1: " + line.text);
        }
        if (line.text.empty()) {
            continue;
        }

        try {
            if (!line.terminated) {
                throw std::runtime_error("row has no line terminator");
            }
            row_handler(line.text, line.line_number);
        } catch (const std::runtime_error& row_error) {
            if (!is_last_line) {
                throw;
            }
            discard_torn_row(file_path, line, row_error.what());
        }
    }
}

bool ends_with_newline(const std::string& file_path) {
    std::ifstream input_stream(file_path, std::ios::binary);
    input_stream.seekg(-1, std::ios::end);
    char last_character = '\0';
    return input_stream.get(last_character) && last_character == '\n';
}

template <typename Record>
bool timestamp_less(const Record& record, long long timestamp) {
    return record.timestamp < timestamp;
}

template <typename Record>
std::vector<Record> records_between(const std::vector<Record>& records, long long start_timestamp, long long end_timestamp) {
    if (start_timestamp > end_timestamp) {
        return {};
    }
    auto range_begin = std::lower_bound(records.begin(), records.end(), start_timestamp, timestamp_less<Record>);
    auto range_end = std::upper_bound(records.begin(), records.end(), end_timestamp,
                                      [](long long timestamp, const Record& record) { return timestamp < record.timestamp; });
    return std::vector<Record>(range_begin, range_end);
}

} // namespace

CsvHistoryStore::CsvHistoryStore(const Config::StorageConfig& storage_config) {
    std::filesystem::path data_directory(storage_config.data_directory);
    if (!data_directory.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(data_directory, directory_error);
        if (directory_error) {
            throw std::runtime_error("Failed to create data directory " + data_directory.string() + ": " +
                                     directory_error.message());
        }
    }

    history_file_path = (data_directory / storage_config.history_file).string();
    trade_file_path = (data_directory / storage_config.trade_file).string();

    load_snapshots();
    load_trades();

    open_for_append(history_stream, history_file_path, HISTORY_HEADER);
    open_for_append(trade_stream, trade_file_path, TRADE_HEADER);
}

CsvHistoryStore::~CsvHistoryStore() {
    if (history_stream.is_open()) {
        history_stream.close();
    }
    if (trade_stream.is_open()) {
        trade_stream.close();
    }
}

void CsvHistoryStore::open_for_append(std::ofstream& file_stream, const std::string& file_path, const char* header) {
    file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Failed to open history file: " + file_path);
    }

    // Write header if file is empty, otherwise make sure the next row starts on its own line
    file_stream.seekp(0, std::ios::end);
    if (file_stream.tellp() == 0) {
        file_stream << header << "\n";
        file_stream.flush();
    } else if (!ends_with_newline(file_path)) {
        file_stream << "\n";
        file_stream.flush();
    }
    if (!file_stream) {
        throw std::runtime_error("Failed to prepare history file for appending: " + file_path);
    }
}

void CsvHistoryStore::load_snapshots() {
    read_csv_file(history_file_path, HISTORY_HEADER, [this](const std::string& line, size_t line_number) {
        std::vector<long long> fields = parse_csv_row(line, 4, history_file_path, line_number);
        snapshots.emplace_back(fields[0], fields[1], fields[2], fields[3]);
    });
    std::stable_sort(snapshots.begin(), snapshots.end(),
                     [](const MarketSnapshot& left, const MarketSnapshot& right) { return left.timestamp < right.timestamp; });
}

void CsvHistoryStore::load_trades() {
    read_csv_file(trade_file_path, TRADE_HEADER, [this](const std::string& line, size_t line_number) {
        std::vector<long long> fields = parse_csv_row(line, 7, trade_file_path, line_number);
        TradeRecord trade;
        trade.timestamp = fields[0];
        trade.price = fields[1];
        trade.owned_units_before = fields[2];
        trade.units_bought = fields[3];
        trade.units_sold = fields[4];
        trade.balance_before = fields[5];
        trade.balance_after = fields[6];
        trades.push_back(trade);
    });
    std::stable_sort(trades.begin(), trades.end(),
                     [](const TradeRecord& left, const TradeRecord& right) { return left.timestamp < right.timestamp; });
}

void CsvHistoryStore::append_snapshot(const MarketSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(store_mutex);

    if (!snapshots.empty() && snapshot.timestamp < snapshots.back().timestamp) {
        throw std::runtime_error("Snapshot timestamp " + std::to_string(snapshot.timestamp) +
                                 " is older than latest stored snapshot " + std::to_string(snapshots.back().timestamp));
    }

    history_stream << snapshot.timestamp << ","
                   << snapshot.price << ","
                   << snapshot.owned_units << ","
                   << snapshot.balance << "\n";
    history_stream.flush();
    if (!history_stream) {
        throw std::runtime_error("Failed to write snapshot to " + history_file_path);
    }

    snapshots.push_back(snapshot);
}

std::optional<MarketSnapshot> CsvHistoryStore::latest_snapshot() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    if (snapshots.empty()) {
        return std::nullopt;
    }
    return snapshots.back();
}

std::vector<MarketSnapshot> CsvHistoryStore::snapshots_between(long long start_timestamp, long long end_timestamp) const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return records_between(snapshots, start_timestamp, end_timestamp);
}

void CsvHistoryStore::append_trade(const TradeRecord& trade) {
    std::lock_guard<std::mutex> lock(store_mutex);

    trade_stream << trade.timestamp << ","
                 << trade.price << ","
                 << trade.owned_units_before << ","
                 << trade.units_bought << ","
                 << trade.units_sold << ","
                 << trade.balance_before << ","
                 << trade.balance_after << "\n";
    trade_stream.flush();
    if (!trade_stream) {
        throw std::runtime_error("Failed to write trade to " + trade_file_path);
    }

    // Keep the in-memory copy sorted even if the clock stepped backwards
    auto insert_position = std::upper_bound(trades.begin(), trades.end(), trade.timestamp,
                                            [](long long timestamp, const TradeRecord& record) { return timestamp < record.timestamp; });
    trades.insert(insert_position, trade);
}

std::vector<TradeRecord> CsvHistoryStore::trades_between(long long start_timestamp, long long end_timestamp) const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return records_between(trades, start_timestamp, end_timestamp);
}

size_t CsvHistoryStore::snapshot_count() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return snapshots.size();
}

size_t CsvHistoryStore::trade_count() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return trades.size();
}

} // namespace Storage
} // namespace BeanTrader
