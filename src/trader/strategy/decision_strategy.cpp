#include "decision_strategy.hpp"
#include <algorithm>
#include <cmath>

namespace BeanTrader {
namespace Core {

TradeDecision make_trade_decision(TradeAction action, double fractional_quantity, long long available_max) {
    if (action == TradeAction::Hold || available_max <= 0 || !std::isfinite(fractional_quantity)) {
        return TradeDecision();
    }

    long long quantity = static_cast<long long>(std::floor(fractional_quantity));
    if (quantity <= 0) {
        return TradeDecision();
    }

    quantity = std::min(quantity, available_max);
    return TradeDecision(action, quantity);
}

} // namespace Core
} // namespace BeanTrader
