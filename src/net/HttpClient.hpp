#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <curl/curl.h>

namespace canopy {

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& what, long status = 0)
        : std::runtime_error(what), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP client over one persistent libcurl handle.
// Not thread-safe: one client per adapter, one adapter per run.
class HttpClient {
public:
    HttpClient(long timeout_seconds, int max_attempts);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // POST body to url. Throws HttpError on transport failure or HTTP >= 400.
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers);

    // Failures after which the server cannot have processed the request.
    static bool retryable(CURLcode code);
    static bool retryable_status(long status);

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURL* curl_{nullptr};
    long  timeout_s_;
    int   max_attempts_;
};

} // namespace canopy
