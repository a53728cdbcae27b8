#ifndef STORAGE_CONFIG_HPP
#define STORAGE_CONFIG_HPP

#include <string>

namespace BeanTrader {
namespace Config {

struct StorageConfig {
    std::string data_directory = "data";
    std::string history_file = "history.csv";
    std::string trade_file = "trades.csv";
};

} // namespace Config
} // namespace BeanTrader

#endif // STORAGE_CONFIG_HPP
