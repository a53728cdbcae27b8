#include "config_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace BeanTrader {
namespace Config {

namespace {
    const char* const WHITESPACE_CHARACTERS = " \t\r\n";

    std::string trim(const std::string& text) {
        const size_t first_position = text.find_first_not_of(WHITESPACE_CHARACTERS);
        if (first_position == std::string::npos) return "";
        const size_t last_position = text.find_last_not_of(WHITESPACE_CHARACTERS);
        return text.substr(first_position, last_position - first_position + 1);
    }

    bool to_bool(const std::string& value) {
        std::string lowered = value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
    }

    void apply_config_value(SystemConfig& cfg, const std::string& key, const std::string& value) {
        // API
        if (key == "api.base_url") cfg.api.base_url = value;
        else if (key == "api.token") cfg.api.token = value;
        else if (key == "api.user_agent") cfg.api.user_agent = value;
        else if (key == "api.timeout_seconds") cfg.api.timeout_seconds = std::stoi(value);
        else if (key == "api.enable_ssl_verification") cfg.api.enable_ssl_verification = to_bool(value);

        // Exchange limits
        else if (key == "exchange.max_calls_per_minute") cfg.exchange.max_calls_per_minute = std::stoi(value);
        else if (key == "exchange.max_units_per_chunk") cfg.exchange.max_units_per_chunk = std::stoi(value);

        // Strategy
        else if (key == "strategy.policy") cfg.strategy.policy = value;
        else if (key == "strategy.lookback_window") cfg.strategy.lookback_window = value;
        else if (key == "strategy.min_data_points") cfg.strategy.min_data_points = std::stoi(value);
        else if (key == "strategy.k_factor") cfg.strategy.k_factor = std::stod(value);
        else if (key == "strategy.fallback_spread") cfg.strategy.fallback_spread = std::stoll(value);
        else if (key == "strategy.min_balance_reserve") cfg.strategy.min_balance_reserve = std::stoll(value);
        else if (key == "strategy.min_units_reserve") cfg.strategy.min_units_reserve = std::stoll(value);
        else if (key == "strategy.trade_fraction") cfg.strategy.trade_fraction = std::stod(value);
        else if (key == "strategy.buy_bands") cfg.strategy.buy_bands = parse_price_bands(value);
        else if (key == "strategy.sell_bands") cfg.strategy.sell_bands = parse_price_bands(value);

        // Execution
        else if (key == "execution.initial_backoff_ms") cfg.execution.initial_backoff_ms = std::stoll(value);
        else if (key == "execution.max_backoff_ms") cfg.execution.max_backoff_ms = std::stoll(value);
        else if (key == "execution.throttle_margin") cfg.execution.throttle_margin = std::stoi(value);
        else if (key == "execution.throttle_delay_ms") cfg.execution.throttle_delay_ms = std::stoll(value);
        else if (key == "execution.inter_chunk_delay_ms") cfg.execution.inter_chunk_delay_ms = std::stoll(value);

        // Timing
        else if (key == "timing.cycle_interval_sec") cfg.timing.cycle_interval_sec = std::stoi(value);
        else if (key == "timing.min_cycle_sleep_ms") cfg.timing.min_cycle_sleep_ms = std::stoll(value);

        // Storage
        else if (key == "storage.data_directory") cfg.storage.data_directory = value;
        else if (key == "storage.history_file") cfg.storage.history_file = value;
        else if (key == "storage.trade_file") cfg.storage.trade_file = value;

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.debug_mode") cfg.logging.debug_mode = to_bool(value);
    }
}

std::vector<PriceBand> parse_price_bands(const std::string& value) {
    std::vector<PriceBand> bands;
    std::stringstream band_stream(value);
    std::string band_text;
    while (std::getline(band_stream, band_text, ';')) {
        band_text = trim(band_text);
        if (band_text.empty()) continue;
        size_t separator_position = band_text.find(':');
        if (separator_position == std::string::npos) {
            throw std::runtime_error("Price band missing ':' separator: " + band_text);
        }
        PriceBand band;
        band.price_bound = std::stoll(trim(band_text.substr(0, separator_position)));
        band.fraction = std::stod(trim(band_text.substr(separator_position + 1)));
        bands.push_back(band);
    }
    return bands;
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file(csv_path);
    if (!config_file.is_open()) return false;

    std::string config_line;
    while (std::getline(config_file, config_line)) {
        const std::string trimmed_line = trim(config_line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') continue;

        // Split on the first comma only; band lists never contain commas
        const size_t comma_position = trimmed_line.find(',');
        if (comma_position == std::string::npos) continue;
        const std::string key = trim(trimmed_line.substr(0, comma_position));
        const std::string value = trim(trimmed_line.substr(comma_position + 1));

        try {
            apply_config_value(cfg, key, value);
        } catch (const std::exception& value_error) {
            throw std::runtime_error("Invalid value for " + key + " (" + value + "): " + value_error.what());
        }
    }
    return true;
}

void apply_environment_overrides(SystemConfig& cfg) {
    const char* token_value = std::getenv("BEAN_TRADER_TOKEN");
    if (token_value != nullptr && token_value[0] != '\0') {
        cfg.api.token = token_value;
    }
}

int load_system_config(SystemConfig& config, const std::string& csv_path) {
    try {
        if (!load_config_from_csv(config, csv_path)) {
            fprintf(stderr, "Cannot open config file %s\n", csv_path.c_str());
            return 1;
        }
    } catch (const std::exception& config_error) {
        fprintf(stderr, "Config file %s rejected: %s\n", csv_path.c_str(), config_error.what());
        return 1;
    }

    apply_environment_overrides(config);
    return 0;
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    if (config.api.token.empty()) {
        error_message = "API token missing (provide api.token or BEAN_TRADER_TOKEN)";
        return false;
    }
    if (config.api.base_url.empty()) {
        error_message = "API base URL missing";
        return false;
    }
    if (config.api.timeout_seconds <= 0) {
        error_message = "api.timeout_seconds must be > 0";
        return false;
    }
    if (config.exchange.max_calls_per_minute <= 0 || config.exchange.max_units_per_chunk <= 0) {
        error_message = "exchange.* limits must be > 0";
        return false;
    }
    if (config.strategy.policy != "threshold" && config.strategy.policy != "band") {
        error_message = "strategy.policy must be 'threshold' or 'band'";
        return false;
    }
    const std::string& window = config.strategy.lookback_window;
    if (window != "1h" && window != "12h" && window != "1d" && window != "1w") {
        error_message = "strategy.lookback_window must be one of 1h, 12h, 1d, 1w";
        return false;
    }
    if (config.strategy.min_data_points < 1) {
        error_message = "strategy.min_data_points must be >= 1";
        return false;
    }
    if (config.strategy.k_factor <= 0.0) {
        error_message = "strategy.k_factor must be > 0";
        return false;
    }
    if (config.strategy.fallback_spread < 0) {
        error_message = "strategy.fallback_spread must be >= 0";
        return false;
    }
    if (config.strategy.min_balance_reserve < 0 || config.strategy.min_units_reserve < 0) {
        error_message = "strategy reserves must be >= 0";
        return false;
    }
    if (config.strategy.trade_fraction <= 0.0 || config.strategy.trade_fraction > 1.0) {
        error_message = "strategy.trade_fraction must be in (0, 1]";
        return false;
    }
    for (const PriceBand& band : config.strategy.buy_bands) {
        if (band.price_bound <= 0 || band.fraction <= 0.0 || band.fraction > 1.0) {
            error_message = "strategy.buy_bands entries need bound > 0 and fraction in (0, 1]";
            return false;
        }
    }
    for (const PriceBand& band : config.strategy.sell_bands) {
        if (band.price_bound <= 0 || band.fraction <= 0.0 || band.fraction > 1.0) {
            error_message = "strategy.sell_bands entries need bound > 0 and fraction in (0, 1]";
            return false;
        }
    }
    if (config.execution.initial_backoff_ms <= 0 || config.execution.max_backoff_ms < config.execution.initial_backoff_ms) {
        error_message = "execution backoff must satisfy 0 < initial_backoff_ms <= max_backoff_ms";
        return false;
    }
    if (config.execution.throttle_margin < 0 || config.execution.throttle_delay_ms < 0 || config.execution.inter_chunk_delay_ms < 0) {
        error_message = "execution throttle and pacing values must be >= 0";
        return false;
    }
    if (config.timing.cycle_interval_sec <= 0 || config.timing.min_cycle_sleep_ms < 0) {
        error_message = "timing.cycle_interval_sec must be > 0 and timing.min_cycle_sleep_ms >= 0";
        return false;
    }
    if (config.storage.data_directory.empty()) {
        error_message = "storage.data_directory is empty";
        return false;
    }
    if (config.logging.log_file.empty()) {
        error_message = "Logging path is empty";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace BeanTrader
