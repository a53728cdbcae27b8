#ifndef STRATEGY_FACTORY_HPP
#define STRATEGY_FACTORY_HPP

#include "decision_strategy.hpp"
#include "configs/strategy_config.hpp"
#include <memory>

namespace BeanTrader {
namespace Core {

// Builds the policy named by strategy.policy; throws std::runtime_error for unknown names
std::unique_ptr<DecisionStrategy> create_decision_strategy(const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace BeanTrader

#endif // STRATEGY_FACTORY_HPP
