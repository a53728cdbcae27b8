#include "threshold_strategy.hpp"
#include "logging/logs/trading_logs.hpp"
#include <algorithm>
#include <cmath>

namespace BeanTrader {
namespace Core {

using Logging::TradingLogs;

ThresholdStrategy::ThresholdStrategy(const Config::StrategyConfig& strategy_config)
    : lookback_window(parse_lookback_window(strategy_config.lookback_window)),
      min_data_points(strategy_config.min_data_points),
      threshold_parameters(strategy_config.k_factor, strategy_config.fallback_spread),
      min_balance_reserve(strategy_config.min_balance_reserve),
      min_units_reserve(strategy_config.min_units_reserve),
      trade_fraction(strategy_config.trade_fraction) {}

TradeDecision ThresholdStrategy::decide(const DecisionContext& context) const {
    const MarketSummary& lookback_summary = context.summaries.for_window(lookback_window);

    if (lookback_summary.entry_count < min_data_points) {
        TradingLogs::log_hold_reason("insufficient data points (" + std::to_string(lookback_summary.entry_count) +
                                     " < " + std::to_string(min_data_points) + ") in " + to_string(lookback_window) + " window");
        return TradeDecision();
    }

    TradeThresholds thresholds = calculate_thresholds(lookback_summary, threshold_parameters);
    TradingLogs::log_thresholds(thresholds);

    if (!thresholds.is_valid) {
        TradingLogs::log_hold_reason("thresholds invalid or crossed: buy=" + std::to_string(thresholds.buy_threshold) +
                                     ", sell=" + std::to_string(thresholds.sell_threshold));
        return TradeDecision();
    }

    const long long current_price = context.snapshot.price;
    if (current_price < thresholds.buy_threshold) {
        return decide_buy(context.snapshot, thresholds);
    }
    if (current_price > thresholds.sell_threshold) {
        return decide_sell(context.snapshot, thresholds);
    }

    TradingLogs::log_hold_reason("price " + std::to_string(current_price) + " is within thresholds");
    return TradeDecision();
}

TradeDecision ThresholdStrategy::decide_buy(const MarketSnapshot& snapshot, const TradeThresholds& thresholds) const {
    if (snapshot.price <= 0) {
        TradingLogs::log_hold_reason("price is not positive");
        return TradeDecision();
    }

    const long long spendable_balance = snapshot.balance - min_balance_reserve;
    const long long max_affordable = static_cast<long long>(
        std::floor(static_cast<double>(spendable_balance) / static_cast<double>(snapshot.price)));

    if (max_affordable <= 0) {
        TradingLogs::log_hold_reason("price " + std::to_string(snapshot.price) + " is below buy threshold " +
                                     std::to_string(thresholds.buy_threshold) + ", but balance is at or below reserve");
        return TradeDecision();
    }

    long long desired_quantity = static_cast<long long>(std::floor(static_cast<double>(max_affordable) * trade_fraction));
    desired_quantity = std::max(1LL, std::min(desired_quantity, max_affordable));
    return make_trade_decision(TradeAction::Buy, static_cast<double>(desired_quantity), max_affordable);
}

TradeDecision ThresholdStrategy::decide_sell(const MarketSnapshot& snapshot, const TradeThresholds& thresholds) const {
    const long long max_sellable = snapshot.owned_units - min_units_reserve;

    if (max_sellable <= 0) {
        TradingLogs::log_hold_reason("price " + std::to_string(snapshot.price) + " is above sell threshold " +
                                     std::to_string(thresholds.sell_threshold) + ", but holdings are at or below reserve");
        return TradeDecision();
    }

    long long desired_quantity = static_cast<long long>(std::floor(static_cast<double>(max_sellable) * trade_fraction));
    desired_quantity = std::max(1LL, std::min(desired_quantity, max_sellable));
    return make_trade_decision(TradeAction::Sell, static_cast<double>(desired_quantity), max_sellable);
}

} // namespace Core
} // namespace BeanTrader
