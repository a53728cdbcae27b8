#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "exchange_config.hpp"
#include "strategy_config.hpp"
#include "execution_config.hpp"
#include "timing_config.hpp"
#include "storage_config.hpp"
#include "logging_config.hpp"

namespace BeanTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Every member carries a usable default; the runtime CSV only needs to list overrides.
 */
struct SystemConfig {
    ApiConfig api;                     // Remote service location and credential
    ExchangeConfig exchange;           // Call budget and chunk cap
    StrategyConfig strategy;           // Decision policy parameters
    ExecutionConfig execution;         // Backoff, throttling and pacing
    TimingConfig timing;               // Outer loop cadence
    StorageConfig storage;             // History and trade log location
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace BeanTrader

#endif // SYSTEM_CONFIG_HPP
