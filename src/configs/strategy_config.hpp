#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <string>
#include <vector>

namespace BeanTrader {
namespace Config {

struct PriceBand {
    long long price_bound;    // Upper bound for buy bands, lower bound for sell bands
    double fraction;          // Fraction of the available quantity to trade
};

struct StrategyConfig {
    // ========================================================================
    // POLICY SELECTION
    // ========================================================================

    std::string policy = "threshold";                // "threshold" or "band"

    // ========================================================================
    // THRESHOLD POLICY
    // ========================================================================

    std::string lookback_window = "1d";              // Summary window used as baseline: 1h, 12h, 1d, 1w
    int min_data_points = 12;                        // Minimum snapshots in the lookback window before trading
    double k_factor = 1.0;                           // Standard deviation multiplier (lower = more sensitive)
    long long fallback_spread = 5;                   // Fixed spread around the mean when std dev is below 1
    long long min_balance_reserve = 300;             // Beans never spent
    long long min_units_reserve = 10;                // Units never sold
    double trade_fraction = 0.15;                    // Fraction of affordable/sellable quantity per cycle

    // ========================================================================
    // BAND POLICY
    // ========================================================================

    // Ascending upper bounds: first band with price <= bound wins
    std::vector<PriceBand> buy_bands = {
        {40, 0.95}, {65, 0.80}, {80, 0.50}, {95, 0.25}, {100, 0.05}
    };

    // Descending lower bounds: first band with price >= bound wins
    std::vector<PriceBand> sell_bands = {
        {150, 0.99}, {140, 0.95}, {130, 0.80}, {120, 0.70}, {110, 0.25}, {100, 0.10}
    };
};

} // namespace Config
} // namespace BeanTrader

#endif // STRATEGY_CONFIG_HPP
