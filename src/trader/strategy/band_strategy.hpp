#ifndef BAND_STRATEGY_HPP
#define BAND_STRATEGY_HPP

#include "decision_strategy.hpp"
#include "configs/strategy_config.hpp"
#include <vector>

namespace BeanTrader {
namespace Core {

// Static price bands, independent of the history statistics.
// Affordability is checked before any buy band, holdings before any sell band.
class BandStrategy : public DecisionStrategy {
public:
    explicit BandStrategy(const Config::StrategyConfig& strategy_config);

    TradeDecision decide(const DecisionContext& context) const override;
    std::string get_strategy_name() const override { return "band"; }

private:
    std::vector<Config::PriceBand> buy_bands;     // Ascending upper bounds
    std::vector<Config::PriceBand> sell_bands;    // Descending lower bounds
};

} // namespace Core
} // namespace BeanTrader

#endif // BAND_STRATEGY_HPP
