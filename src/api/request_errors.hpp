#ifndef REQUEST_ERRORS_HPP
#define REQUEST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace BeanTrader {
namespace API {

enum class RequestErrorKind {
    RateLimited,      // Remote signalled throttling (HTTP 429)
    RequestFailed,    // Network failure, non-2xx status or malformed body
    Fatal             // Anything that is not a transport failure
};

// A failed remote request. Recoverable by aborting the current operation.
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& message)
        : std::runtime_error(message), error_kind(RequestErrorKind::RequestFailed) {}

    RequestErrorKind kind() const { return error_kind; }

protected:
    RequestError(const std::string& message, RequestErrorKind kind_value)
        : std::runtime_error(message), error_kind(kind_value) {}

private:
    RequestErrorKind error_kind;
};

// A request rejected because the call budget was exceeded. Recoverable by backoff and retry.
class RateLimitError : public RequestError {
public:
    explicit RateLimitError(const std::string& message)
        : RequestError(message, RequestErrorKind::RateLimited) {}
};

inline RequestErrorKind classify_request_failure(const std::exception& exception_error) {
    const RequestError* request_error = dynamic_cast<const RequestError*>(&exception_error);
    if (request_error == nullptr) {
        return RequestErrorKind::Fatal;
    }
    return request_error->kind();
}

inline std::string to_string(RequestErrorKind kind) {
    switch (kind) {
        case RequestErrorKind::RateLimited: return "rate limited";
        case RequestErrorKind::RequestFailed: return "request failed";
        case RequestErrorKind::Fatal: return "fatal";
    }
    return "unknown";
}

} // namespace API
} // namespace BeanTrader

#endif // REQUEST_ERRORS_HPP
