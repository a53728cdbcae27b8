#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "system_config.hpp"
#include <string>
#include <vector>

namespace BeanTrader {
namespace Config {

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the file cannot be opened.
// Throws std::runtime_error naming the key when a value cannot be parsed.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Parse "bound:fraction;bound:fraction" into price bands.
std::vector<PriceBand> parse_price_bands(const std::string& value);

// Apply overrides taken from the process environment (BEAN_TRADER_TOKEN).
void apply_environment_overrides(SystemConfig& cfg);

// Load complete system configuration from csv_path plus environment. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config, const std::string& csv_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& error_message);

} // namespace Config
} // namespace BeanTrader

#endif // CONFIG_LOADER_HPP
