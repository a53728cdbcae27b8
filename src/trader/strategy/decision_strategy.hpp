#ifndef DECISION_STRATEGY_HPP
#define DECISION_STRATEGY_HPP

#include "trader/data_structures/data_structures.hpp"
#include "trader/analysis/summary_compiler.hpp"
#include <string>

namespace BeanTrader {
namespace Core {

// Everything a policy may look at when deciding a cycle's trade
struct DecisionContext {
    MarketSnapshot snapshot;
    MarketSummaries summaries;

    DecisionContext() {}
    DecisionContext(const MarketSnapshot& snapshot_value, const MarketSummaries& summaries_value)
        : snapshot(snapshot_value), summaries(summaries_value) {}
};

class DecisionStrategy {
public:
    virtual ~DecisionStrategy() = default;

    virtual TradeDecision decide(const DecisionContext& context) const = 0;
    virtual std::string get_strategy_name() const = 0;
};

// Floors the quantity and clamps it to [1, available_max]; a non-positive result becomes Hold
TradeDecision make_trade_decision(TradeAction action, double fractional_quantity, long long available_max);

} // namespace Core
} // namespace BeanTrader

#endif // DECISION_STRATEGY_HPP
