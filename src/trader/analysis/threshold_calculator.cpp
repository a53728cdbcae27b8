#include "threshold_calculator.hpp"
#include "logging/logger/async_logger.hpp"
#include <algorithm>
#include <cmath>

namespace BeanTrader {
namespace Core {

TradeThresholds calculate_thresholds(const MarketSummary& summary, const ThresholdParameters& parameters) {
    const double baseline_mean = summary.mean_price;
    const double baseline_std_dev = summary.sample_std_dev;

    TradeThresholds thresholds;

    if (baseline_std_dev < 1.0) {
        Logging::log_debug("standard deviation is near zero, using fixed threshold spread");
        thresholds.buy_threshold = static_cast<long long>(std::floor(baseline_mean - static_cast<double>(parameters.fallback_spread)));
        thresholds.sell_threshold = static_cast<long long>(std::floor(baseline_mean + static_cast<double>(parameters.fallback_spread)));
    } else {
        thresholds.buy_threshold = static_cast<long long>(std::floor(baseline_mean - parameters.k_factor * baseline_std_dev));
        thresholds.sell_threshold = static_cast<long long>(std::floor(baseline_mean + parameters.k_factor * baseline_std_dev));
    }

    thresholds.buy_threshold = std::max(1LL, thresholds.buy_threshold);
    thresholds.is_valid = thresholds.buy_threshold < thresholds.sell_threshold;
    return thresholds;
}

} // namespace Core
} // namespace BeanTrader
