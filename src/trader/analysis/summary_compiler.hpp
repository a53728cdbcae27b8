#ifndef SUMMARY_COMPILER_HPP
#define SUMMARY_COMPILER_HPP

#include "storage/history_store.hpp"
#include <string>

namespace BeanTrader {
namespace Core {

// Price statistics over snapshots with timestamp in [period_start, period_end].
// All numeric fields are 0 when entry_count is 0.
struct MarketSummary {
    long long period_start;
    long long period_end;
    long long entry_count;
    long long min_price;
    long long max_price;
    double mean_price;
    double sample_std_dev;      // Bessel-corrected, 0 below two entries

    MarketSummary()
        : period_start(0), period_end(0), entry_count(0), min_price(0), max_price(0),
          mean_price(0.0), sample_std_dev(0.0) {}
};

enum class LookbackWindow { LastHour, Last12Hours, LastDay, LastWeek };

// Accepts "1h", "12h", "1d", "1w"; throws std::invalid_argument otherwise
LookbackWindow parse_lookback_window(const std::string& window_name);
std::string to_string(LookbackWindow window);
long long lookback_window_milliseconds(LookbackWindow window);

// Fixed set of lookback windows compiled against one "now"
struct MarketSummaries {
    MarketSummary last_1h;
    MarketSummary last_12h;
    MarketSummary last_1d;
    MarketSummary last_1w;

    const MarketSummary& for_window(LookbackWindow window) const;
};

double calculate_sample_std_dev(const std::vector<long long>& prices, double mean_price);

MarketSummary compile_market_summary(const Storage::HistoryStoreInterface& history_store,
                                     long long period_start, long long period_end);

MarketSummaries compile_market_summaries(const Storage::HistoryStoreInterface& history_store, long long now_timestamp);

} // namespace Core
} // namespace BeanTrader

#endif // SUMMARY_COMPILER_HPP
