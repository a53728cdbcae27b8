#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

namespace BeanTrader {

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string method;                 // GET or POST
    std::string url;
    std::vector<std::string> headers;   // "Name: value" lines
    std::string body;                   // leave empty for bodiless requests
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpRequest(const std::string& request_method,
                const std::string& request_url,
                int timeout = 30,
                bool ssl_verify = true,
                std::string request_body = "")
        : method(request_method), url(request_url), body(std::move(request_body)),
          timeout_seconds(timeout), enable_ssl_verification(ssl_verify) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Raised when no HTTP response could be obtained at all (DNS, connect, TLS, timeout)
class HttpTransportError : public std::runtime_error {
public:
    explicit HttpTransportError(const std::string& message) : std::runtime_error(message) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Performs exactly one HTTP exchange. Never retries; any status code is returned to the caller.
HttpResponse http_perform(const HttpRequest& req);

} // namespace BeanTrader

#endif // HTTP_UTILS_HPP
