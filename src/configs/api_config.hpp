#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace BeanTrader {
namespace Config {

struct ApiConfig {
    // Authentication (fixed session token, sent as a cookie)
    std::string token;

    // Service location
    std::string base_url = "https://sillypost.net";
    std::string user_agent = "bean-trader/1.0";

    // HTTP Configuration
    int timeout_seconds = 30;
    bool enable_ssl_verification = true;

    // Endpoints Configuration
    struct {
        std::string price = "/games/sillyexchange";
        std::string owned = "/games/sillyexchange/owned";
        std::string balance = "/beans";
        std::string buy = "/games/sillyexchange/buy/";
        std::string sell = "/games/sillyexchange/sell/";
    } endpoints;
};

} // namespace Config
} // namespace BeanTrader

#endif // API_CONFIG_HPP
