#include "http_transport.hpp"
#include <curl/curl.h>

namespace BeanTrader {
namespace API {

CurlHttpTransport::CurlHttpTransport() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw HttpTransportError("Failed to initialize libcurl");
    }
}

CurlHttpTransport::~CurlHttpTransport() {
    curl_global_cleanup();
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& request) {
    return http_perform(request);
}

} // namespace API
} // namespace BeanTrader
