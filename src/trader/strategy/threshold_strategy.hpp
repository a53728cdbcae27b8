#ifndef THRESHOLD_STRATEGY_HPP
#define THRESHOLD_STRATEGY_HPP

#include "decision_strategy.hpp"
#include "trader/analysis/threshold_calculator.hpp"
#include "configs/strategy_config.hpp"

namespace BeanTrader {
namespace Core {

/**
 * ThresholdStrategy - statistical mean-reversion policy.
 *
 * Buys a fraction of the affordable quantity when the price falls below
 * mean - k*sd of the lookback window, sells a fraction of the sellable
 * quantity when it rises above mean + k*sd. Reserves of beans and units are
 * never traded away. Buy is checked first.
 */
class ThresholdStrategy : public DecisionStrategy {
public:
    explicit ThresholdStrategy(const Config::StrategyConfig& strategy_config);

    TradeDecision decide(const DecisionContext& context) const override;
    std::string get_strategy_name() const override { return "threshold"; }

private:
    LookbackWindow lookback_window;
    long long min_data_points;
    ThresholdParameters threshold_parameters;
    long long min_balance_reserve;
    long long min_units_reserve;
    double trade_fraction;

    TradeDecision decide_buy(const MarketSnapshot& snapshot, const TradeThresholds& thresholds) const;
    TradeDecision decide_sell(const MarketSnapshot& snapshot, const TradeThresholds& thresholds) const;
};

} // namespace Core
} // namespace BeanTrader

#endif // THRESHOLD_STRATEGY_HPP
