#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include <curl/curl.h>

struct HttpResponse {
    long status = 0;
    std::string body;
};

enum class TransportErrorKind {
    CONNECT,
    TIMEOUT,
    OTHER
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::OTHER;
    std::string message;
};

// Either the server answered (any status), or the request never completed.
using HttpOutcome = std::variant<HttpResponse, TransportError>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpOutcome get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// One easy handle per invocation; its connection cache is reused across calls.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpOutcome get(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    CurlHandle curl_;
    // Registered with CURLOPT_ERRORBUFFER, so it must live as long as the handle
    char error_buffer_[CURL_ERROR_SIZE] = {0};
};

TransportErrorKind classify_curl_error(CURLcode code);
