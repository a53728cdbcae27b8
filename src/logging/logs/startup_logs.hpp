#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>
#include <cstddef>

namespace BeanTrader {
namespace Logging {

// Application startup and shutdown sequence
class StartupLogs {
public:
    static void log_application_header();
    static void log_runtime_configuration(const Config::SystemConfig& config);
    static void log_strategy_configuration(const Config::StrategyConfig& strategy_config);
    static void log_history_store_opened(const std::string& history_file_path, size_t snapshot_count, size_t trade_count);
    static void log_shutdown(unsigned long total_cycles, int exit_code);

private:
    static std::string format_bands(const std::vector<Config::PriceBand>& bands, const std::string& comparison);
};

} // namespace Logging
} // namespace BeanTrader

#endif // STARTUP_LOGS_HPP
