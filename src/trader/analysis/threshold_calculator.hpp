#ifndef THRESHOLD_CALCULATOR_HPP
#define THRESHOLD_CALCULATOR_HPP

#include "summary_compiler.hpp"

namespace BeanTrader {
namespace Core {

struct TradeThresholds {
    long long buy_threshold;
    long long sell_threshold;
    bool is_valid;              // buy_threshold < sell_threshold

    TradeThresholds() : buy_threshold(0), sell_threshold(0), is_valid(false) {}
};

struct ThresholdParameters {
    double k_factor;            // Standard deviation multiplier
    long long fallback_spread;  // Fixed distance from the mean when the deviation is below 1

    ThresholdParameters() : k_factor(1.0), fallback_spread(5) {}
    ThresholdParameters(double k_value, long long spread_value) : k_factor(k_value), fallback_spread(spread_value) {}
};

// Buy threshold is clamped to at least 1 bean
TradeThresholds calculate_thresholds(const MarketSummary& summary, const ThresholdParameters& parameters);

} // namespace Core
} // namespace BeanTrader

#endif // THRESHOLD_CALCULATOR_HPP
