#ifndef EXCHANGE_CONFIG_HPP
#define EXCHANGE_CONFIG_HPP

namespace BeanTrader {
namespace Config {

// Limits imposed by the remote exchange
struct ExchangeConfig {
    int max_calls_per_minute = 550;    // Call budget over any trailing 60s window
    int max_units_per_chunk = 200;     // Maximum units per buy/sell submission
};

} // namespace Config
} // namespace BeanTrader

#endif // EXCHANGE_CONFIG_HPP
