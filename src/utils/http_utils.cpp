#include "http_utils.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

namespace BeanTrader {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlHeaderListDeleter {
    void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

CurlHeaderList build_header_list(const std::vector<std::string>& header_lines) {
    curl_slist* header_list = nullptr;
    for (const std::string& header_line : header_lines) {
        curl_slist* extended_list = curl_slist_append(header_list, header_line.c_str());
        if (extended_list == nullptr) {
            curl_slist_free_all(header_list);
            throw HttpTransportError("Failed to build request header list");
        }
        header_list = extended_list;
    }
    return CurlHeaderList(header_list);
}

} // namespace

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    const size_t received_bytes = size * nmemb;
    s->append(static_cast<const char*>(contents), received_bytes);
    return received_bytes;
}

HttpResponse http_perform(const HttpRequest& req) {
    CurlEasyHandle easy_handle(curl_easy_init());
    if (!easy_handle) {
        throw HttpTransportError("Failed to initialize CURL for HTTP " + req.method + " request");
    }
    CurlHeaderList header_list = build_header_list(req.headers);

    HttpResponse response;
    CURL* curl = easy_handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(req.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    const long verify_peer = req.enable_ssl_verification ? 1L : 0L;
    const long verify_host = req.enable_ssl_verification ? 2L : 0L;
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_peer);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_host);

    // POST always carries a (possibly empty) body; other non-GET verbs go through CUSTOMREQUEST
    if (req.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else if (req.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    const CURLcode perform_result = curl_easy_perform(curl);
    if (perform_result != CURLE_OK) {
        throw HttpTransportError("HTTP " + req.method + " " + req.url + " failed: " +
                                 curl_easy_strerror(perform_result));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace BeanTrader
