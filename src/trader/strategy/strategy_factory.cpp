#include "strategy_factory.hpp"
#include "threshold_strategy.hpp"
#include "band_strategy.hpp"
#include <stdexcept>

namespace BeanTrader {
namespace Core {

std::unique_ptr<DecisionStrategy> create_decision_strategy(const Config::StrategyConfig& strategy_config) {
    if (strategy_config.policy == "threshold") {
        return std::make_unique<ThresholdStrategy>(strategy_config);
    }
    if (strategy_config.policy == "band") {
        return std::make_unique<BandStrategy>(strategy_config);
    }
    throw std::runtime_error("Unknown strategy policy: " + strategy_config.policy);
}

} // namespace Core
} // namespace BeanTrader
