#ifndef EXCHANGE_CLIENT_HPP
#define EXCHANGE_CLIENT_HPP

#include "market_api_interface.hpp"
#include "http_transport.hpp"
#include "rate_tracker.hpp"
#include "request_errors.hpp"
#include "configs/api_config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace BeanTrader {
namespace API {

// Converts a JSON integer, finite float (floored) or numeric string into an integer.
// Throws RequestError for anything else.
long long parse_integer_value(const nlohmann::json& value, const std::string& context);

/**
 * ExchangeClient - typed operations against the silly exchange.
 *
 * Every call goes through send(), which registers with the rate tracker exactly
 * once and maps failures onto RequestError / RateLimitError. No retries here.
 */
class ExchangeClient : public MarketApiInterface {
public:
    ExchangeClient(const Config::ApiConfig& api_config, HttpTransport& transport, RateTracker& rate_tracker);

    // Returns the decoded body, or null for an empty body
    nlohmann::json send(const std::string& method, const std::string& path, const std::string& payload = "");

    long long fetch_price() override;
    long long fetch_owned_units() override;
    long long fetch_balance() override;

    void submit_buy(long long units) override;
    void submit_sell(long long units) override;

private:
    const Config::ApiConfig& config;
    HttpTransport& http_transport;
    RateTracker& rate_tracker;

    std::string build_url(const std::string& path) const;
    HttpRequest build_request(const std::string& method, const std::string& url, const std::string& payload) const;
};

} // namespace API
} // namespace BeanTrader

#endif // EXCHANGE_CLIENT_HPP
