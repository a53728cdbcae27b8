#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include "utils/http_utils.hpp"

namespace BeanTrader {
namespace API {

// Single HTTP exchange. Implementations throw HttpTransportError when no response was received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    // Non-copyable
    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;
};

} // namespace API
} // namespace BeanTrader

#endif // HTTP_TRANSPORT_HPP
