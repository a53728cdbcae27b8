#include "exchange_client.hpp"
#include "logging/logger/async_logger.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace BeanTrader {
namespace API {

namespace {

constexpr long HTTP_STATUS_TOO_MANY_REQUESTS = 429;

bool is_success_status(long status_code) {
    return status_code >= 200 && status_code < 300;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Prefers the body's message/error field, falls back to the raw body
std::string extract_error_message(const std::string& response_body) {
    if (is_blank(response_body)) {
        return "(empty body)";
    }
    json error_json = json::parse(response_body, nullptr, false);
    if (!error_json.is_discarded() && error_json.is_object()) {
        for (const char* field_name : {"message", "error"}) {
            auto field_iterator = error_json.find(field_name);
            if (field_iterator != error_json.end() && !field_iterator->is_null()) {
                if (field_iterator->is_string()) {
                    return field_iterator->get<std::string>();
                }
                return field_iterator->dump();
            }
        }
    }
    return response_body;
}

long long floor_to_integer(double value, const std::string& context) {
    if (!std::isfinite(value)) {
        throw RequestError(context + ": value is not a finite number");
    }
    double floored_value = std::floor(value);
    if (floored_value < static_cast<double>(std::numeric_limits<long long>::min()) ||
        floored_value >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw RequestError(context + ": value out of range");
    }
    return static_cast<long long>(floored_value);
}

} // namespace

long long parse_integer_value(const json& value, const std::string& context) {
    if (value.is_number_unsigned()) {
        const unsigned long long unsigned_value = value.get<unsigned long long>();
        if (unsigned_value > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            throw RequestError(context + ": value out of range: " + value.dump());
        }
        return static_cast<long long>(unsigned_value);
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        return floor_to_integer(value.get<double>(), context);
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            double parsed_value = std::stod(text);
            return floor_to_integer(parsed_value, context);
        } catch (const std::invalid_argument&) {
            throw RequestError(context + ": string value is not a valid integer: " + text);
        } catch (const std::out_of_range&) {
            throw RequestError(context + ": string value out of range: " + text);
        }
    }
    throw RequestError(context + ": invalid response: " + value.dump());
}

ExchangeClient::ExchangeClient(const Config::ApiConfig& api_config, HttpTransport& transport, RateTracker& tracker)
    : config(api_config), http_transport(transport), rate_tracker(tracker) {}

std::string ExchangeClient::build_url(const std::string& path) const {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        return path;
    }
    std::string base_url = config.base_url;
    if (!base_url.empty() && base_url.back() == '/' && !path.empty() && path.front() == '/') {
        base_url.pop_back();
    }
    return base_url + path;
}

HttpRequest ExchangeClient::build_request(const std::string& method, const std::string& url, const std::string& payload) const {
    HttpRequest request(method, url, config.timeout_seconds, config.enable_ssl_verification, payload);
    request.headers.push_back("Accept: application/json, text/plain, */*");
    request.headers.push_back("Pragma: no-cache");
    request.headers.push_back("Cache-Control: no-cache");
    request.headers.push_back("User-Agent: " + config.user_agent);
    request.headers.push_back("Cookie: token=" + config.token);
    if (!payload.empty()) {
        request.headers.push_back("Content-Type: application/json");
    }
    return request;
}

json ExchangeClient::send(const std::string& method, const std::string& path, const std::string& payload) {
    const std::string url = build_url(path);
    const std::string request_label = method + " " + url;

    Logging::log_debug("send " + request_label);

    HttpResponse response;
    try {
        response = http_transport.perform(build_request(method, url, payload));
    } catch (const HttpTransportError& transport_error) {
        rate_tracker.record_call();
        throw RequestError("request failed to " + request_label + ": " + transport_error.what());
    }
    rate_tracker.record_call();

    if (response.status_code == HTTP_STATUS_TOO_MANY_REQUESTS) {
        throw RateLimitError("rate limit exceeded for " + request_label + " error: " + extract_error_message(response.body));
    }

    if (!is_success_status(response.status_code)) {
        throw RequestError("response " + std::to_string(response.status_code) + " for " + request_label +
                           " error: " + extract_error_message(response.body));
    }

    if (is_blank(response.body)) {
        Logging::log_debug("response " + std::to_string(response.status_code) + " with empty body");
        return json(nullptr);
    }

    json body_json = json::parse(response.body, nullptr, false);
    if (body_json.is_discarded()) {
        throw RequestError("response invalid for " + request_label + ": malformed JSON body");
    }

    Logging::log_debug("response " + std::to_string(response.status_code) + " body " + body_json.dump());
    return body_json;
}

long long ExchangeClient::fetch_price() {
    json result = send("POST", config.endpoints.price);
    if (!result.is_object() || !result.contains("price")) {
        throw RequestError("fetch_price invalid response: " + result.dump());
    }
    return parse_integer_value(result["price"], "fetch_price");
}

long long ExchangeClient::fetch_owned_units() {
    return parse_integer_value(send("POST", config.endpoints.owned), "fetch_owned_units");
}

long long ExchangeClient::fetch_balance() {
    return parse_integer_value(send("GET", config.endpoints.balance), "fetch_balance");
}

void ExchangeClient::submit_buy(long long units) {
    send("POST", config.endpoints.buy + std::to_string(units));
}

void ExchangeClient::submit_sell(long long units) {
    send("POST", config.endpoints.sell + std::to_string(units));
}

} // namespace API
} // namespace BeanTrader
