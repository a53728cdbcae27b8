#include "startup_logs.hpp"
#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <sstream>

namespace BeanTrader {
namespace Logging {

void StartupLogs::log_application_header() {
    LOG_BANNER("BEAN TRADER - Silly Exchange Trading Bot");
}

void StartupLogs::log_runtime_configuration(const Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("RUNTIME CONFIGURATION");
    TABLE_HEADER_30("Setting", "Value");
    TABLE_ROW_30("Service", config.api.base_url);
    TABLE_ROW_30("HTTP timeout", std::to_string(config.api.timeout_seconds) + "s");
    TABLE_ROW_30("Call budget", std::to_string(config.exchange.max_calls_per_minute) + "/min");
    TABLE_ROW_30("Chunk size", std::to_string(config.exchange.max_units_per_chunk) + " units");
    TABLE_ROW_30("Cycle interval", std::to_string(config.timing.cycle_interval_sec) + "s");
    TABLE_ROW_30("Backoff", std::to_string(config.execution.initial_backoff_ms) + "-" +
                            std::to_string(config.execution.max_backoff_ms) + "ms");
    TABLE_ROW_30("Data directory", config.storage.data_directory);
    TABLE_ROW_30("Debug logging", config.logging.debug_mode ? "on" : "off");
    TABLE_FOOTER_30();
    LOG_STARTUP_SEPARATOR();
}

std::string StartupLogs::format_bands(const std::vector<Config::PriceBand>& bands, const std::string& comparison) {
    std::ostringstream oss;
    for (size_t band_index = 0; band_index < bands.size(); band_index++) {
        if (band_index > 0) {
            oss << " ";
        }
        oss << comparison << bands[band_index].price_bound << ":" << TradingLogs::format_decimal(bands[band_index].fraction, 2);
    }
    return oss.str();
}

void StartupLogs::log_strategy_configuration(const Config::StrategyConfig& strategy_config) {
    LOG_STARTUP_SECTION_HEADER("STRATEGY CONFIGURATION");
    LOG_STARTUP_CONTENT("Policy: " + strategy_config.policy);
    if (strategy_config.policy == "band") {
        LOG_STARTUP_CONTENT("Buy bands: " + format_bands(strategy_config.buy_bands, "<="));
        LOG_STARTUP_CONTENT("Sell bands: " + format_bands(strategy_config.sell_bands, ">="));
    } else {
        LOG_STARTUP_CONTENT("Lookback window: " + strategy_config.lookback_window +
                            " (min " + std::to_string(strategy_config.min_data_points) + " data points)");
        LOG_STARTUP_CONTENT("K factor: " + TradingLogs::format_decimal(strategy_config.k_factor, 2) +
                            ", fallback spread: " + std::to_string(strategy_config.fallback_spread));
        LOG_STARTUP_CONTENT("Reserves: " + TradingLogs::format_beans(strategy_config.min_balance_reserve) +
                            ", " + std::to_string(strategy_config.min_units_reserve) + " units");
        LOG_STARTUP_CONTENT("Trade fraction: " + TradingLogs::format_decimal(strategy_config.trade_fraction, 2));
    }
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_history_store_opened(const std::string& history_file_path, size_t snapshot_count, size_t trade_count) {
    LOG_STARTUP_SECTION_HEADER("HISTORY STORE");
    LOG_STARTUP_CONTENT("File: " + history_file_path);
    LOG_STARTUP_CONTENT("Snapshots loaded: " + std::to_string(snapshot_count));
    LOG_STARTUP_CONTENT("Trades loaded: " + std::to_string(trade_count));
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_shutdown(unsigned long total_cycles, int exit_code) {
    log_message("Trading session complete", "");
    log_message("Total cycles executed: " + std::to_string(total_cycles), "");
    if (exit_code != 0) {
        log_message("Exiting with status " + std::to_string(exit_code), "");
    }
}

} // namespace Logging
} // namespace BeanTrader
