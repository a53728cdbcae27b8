#include "band_strategy.hpp"
#include "logging/logs/trading_logs.hpp"
#include <algorithm>

namespace BeanTrader {
namespace Core {

using Logging::TradingLogs;

BandStrategy::BandStrategy(const Config::StrategyConfig& strategy_config)
    : buy_bands(strategy_config.buy_bands), sell_bands(strategy_config.sell_bands) {
    std::stable_sort(buy_bands.begin(), buy_bands.end(),
                     [](const Config::PriceBand& left, const Config::PriceBand& right) { return left.price_bound < right.price_bound; });
    std::stable_sort(sell_bands.begin(), sell_bands.end(),
                     [](const Config::PriceBand& left, const Config::PriceBand& right) { return left.price_bound > right.price_bound; });
}

TradeDecision BandStrategy::decide(const DecisionContext& context) const {
    const MarketSnapshot& snapshot = context.snapshot;
    if (snapshot.price <= 0) {
        TradingLogs::log_hold_reason("price is not positive");
        return TradeDecision();
    }

    const long long max_buy_units = snapshot.balance / snapshot.price;
    if (max_buy_units > 0) {
        for (const Config::PriceBand& band : buy_bands) {
            if (snapshot.price <= band.price_bound) {
                return make_trade_decision(TradeAction::Buy, static_cast<double>(max_buy_units) * band.fraction, max_buy_units);
            }
        }
    }

    if (snapshot.owned_units > 0) {
        for (const Config::PriceBand& band : sell_bands) {
            if (snapshot.price >= band.price_bound) {
                return make_trade_decision(TradeAction::Sell, static_cast<double>(snapshot.owned_units) * band.fraction, snapshot.owned_units);
            }
        }
    }

    TradingLogs::log_hold_reason("price " + std::to_string(snapshot.price) + " is outside every actionable band");
    return TradeDecision();
}

} // namespace Core
} // namespace BeanTrader
