#include "http_client.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <string>

namespace {

// HTTP body callback: append to a std::string
size_t write_body(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    body->append(static_cast<const char*>(ptr), bytes);
    return bytes;
}

} // namespace

TransportErrorKind classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportErrorKind::CONNECT;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportErrorKind::TIMEOUT;
        default:
            return TransportErrorKind::OTHER;
    }
}

CurlHttpClient::CurlHttpClient() : curl_(curl_easy_init()) {
    if (!curl_) {
        throw PipwallException(get_string("error.curl_init_failed"));
    }
}

HttpOutcome CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    // Reset options but keep live connections for the next call
    curl_easy_reset(curl_.get());

    std::string body;
    error_buffer_[0] = '\0';

    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl_.get(), CURLOPT_ERRORBUFFER, error_buffer_);
    curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, "pipwall/" PIPWALL_VERSION);

    CURLcode res = curl_easy_perform(curl_.get());
    if (res != CURLE_OK) {
        std::string message = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(res);
        return TransportError{classify_curl_error(res), std::move(message)};
    }

    long status = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &status);
    return HttpResponse{status, std::move(body)};
}
