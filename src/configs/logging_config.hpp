// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace BeanTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "runtime_logs/bean_trader.log";
    bool debug_mode = false;
};

} // namespace Config
} // namespace BeanTrader

#endif // LOGGING_CONFIG_HPP
