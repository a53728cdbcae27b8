#include "summary_compiler.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace BeanTrader {
namespace Core {

LookbackWindow parse_lookback_window(const std::string& window_name) {
    if (window_name == "1h") return LookbackWindow::LastHour;
    if (window_name == "12h") return LookbackWindow::Last12Hours;
    if (window_name == "1d") return LookbackWindow::LastDay;
    if (window_name == "1w") return LookbackWindow::LastWeek;
    throw std::invalid_argument("Unknown lookback window: " + window_name);
}

std::string to_string(LookbackWindow window) {
    switch (window) {
        case LookbackWindow::LastHour: return "1h";
        case LookbackWindow::Last12Hours: return "12h";
        case LookbackWindow::LastDay: return "1d";
        case LookbackWindow::LastWeek: return "1w";
    }
    return "unknown";
}

long long lookback_window_milliseconds(LookbackWindow window) {
    switch (window) {
        case LookbackWindow::LastHour: return TimeUtils::MILLISECONDS_PER_HOUR;
        case LookbackWindow::Last12Hours: return 12 * TimeUtils::MILLISECONDS_PER_HOUR;
        case LookbackWindow::LastDay: return TimeUtils::MILLISECONDS_PER_DAY;
        case LookbackWindow::LastWeek: return TimeUtils::MILLISECONDS_PER_WEEK;
    }
    throw std::invalid_argument("Unknown lookback window");
}

const MarketSummary& MarketSummaries::for_window(LookbackWindow window) const {
    switch (window) {
        case LookbackWindow::LastHour: return last_1h;
        case LookbackWindow::Last12Hours: return last_12h;
        case LookbackWindow::LastDay: return last_1d;
        case LookbackWindow::LastWeek: return last_1w;
    }
    throw std::invalid_argument("Unknown lookback window");
}

double calculate_sample_std_dev(const std::vector<long long>& prices, double mean_price) {
    if (prices.size() < 2) {
        return 0.0;
    }
    double squared_deviation_sum = 0.0;
    for (long long price : prices) {
        double deviation = static_cast<double>(price) - mean_price;
        squared_deviation_sum += deviation * deviation;
    }
    return std::sqrt(squared_deviation_sum / static_cast<double>(prices.size() - 1));
}

MarketSummary compile_market_summary(const Storage::HistoryStoreInterface& history_store,
                                     long long period_start, long long period_end) {
    MarketSummary summary;
    summary.period_start = period_start;
    summary.period_end = period_end;

    std::vector<MarketSnapshot> period_snapshots = history_store.snapshots_between(period_start, period_end);
    if (period_snapshots.empty()) {
        return summary;
    }

    std::vector<long long> prices;
    prices.reserve(period_snapshots.size());
    for (const MarketSnapshot& snapshot : period_snapshots) {
        prices.push_back(snapshot.price);
    }

    auto price_bounds = std::minmax_element(prices.begin(), prices.end());
    long long price_sum = 0;
    for (long long price : prices) {
        price_sum += price;
    }

    summary.entry_count = static_cast<long long>(prices.size());
    summary.min_price = *price_bounds.first;
    summary.max_price = *price_bounds.second;
    summary.mean_price = static_cast<double>(price_sum) / static_cast<double>(summary.entry_count);
    summary.sample_std_dev = calculate_sample_std_dev(prices, summary.mean_price);
    return summary;
}

MarketSummaries compile_market_summaries(const Storage::HistoryStoreInterface& history_store, long long now_timestamp) {
    MarketSummaries summaries;
    summaries.last_1h = compile_market_summary(history_store, now_timestamp - lookback_window_milliseconds(LookbackWindow::LastHour), now_timestamp);
    summaries.last_12h = compile_market_summary(history_store, now_timestamp - lookback_window_milliseconds(LookbackWindow::Last12Hours), now_timestamp);
    summaries.last_1d = compile_market_summary(history_store, now_timestamp - lookback_window_milliseconds(LookbackWindow::LastDay), now_timestamp);
    summaries.last_1w = compile_market_summary(history_store, now_timestamp - lookback_window_milliseconds(LookbackWindow::LastWeek), now_timestamp);
    return summaries;
}

} // namespace Core
} // namespace BeanTrader
