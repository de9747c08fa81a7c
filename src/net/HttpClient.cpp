#include "net/HttpClient.hpp"
#include <chrono>
#include <iostream>
#include <thread>

using namespace canopy;

HttpClient::HttpClient(long timeout_seconds, int max_attempts)
    : timeout_s_(timeout_seconds), max_attempts_(max_attempts < 1 ? 1 : max_attempts) {
    curl_ = curl_easy_init();
    if (!curl_) throw HttpError("[HTTP] curl_easy_init failed");
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    // curl_global_cleanup() belongs to main(), after every handle is gone.
}

size_t HttpClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool HttpClient::retryable(CURLcode code) {
    return code == CURLE_COULDNT_RESOLVE_HOST ||
           code == CURLE_COULDNT_RESOLVE_PROXY ||
           code == CURLE_COULDNT_CONNECT;
}

bool HttpClient::retryable_status(long status) {
    return status == 429 || status == 503;
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers) {
    // --- Headers ---
    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers) {
        hdrs = curl_slist_append(hdrs, h.c_str());
    }

    HttpResponse response;

    // --- Configure persistent handle ---
    curl_easy_setopt(curl_, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     hdrs);
    curl_easy_setopt(curl_, CURLOPT_POST,           1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      &response.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        timeout_s_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL,       1L);

    // --- Retry loop: only where the server never saw the request ---
    // A timed-out create may already be committed remotely; repeating it
    // would duplicate the record, so timeouts are not retried here.
    CURLcode res = CURLE_OK;
    for (int attempt = 0; attempt < max_attempts_; ++attempt) {
        response.body.clear();
        response.status = 0;
        res = curl_easy_perform(curl_);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
            if (!retryable_status(response.status)) break;
        } else if (!retryable(res)) {
            break;
        }
        if (attempt < max_attempts_ - 1) {
            std::cout << "[HTTP] Retry " << (attempt + 1) << "/" << max_attempts_ << " ("
                      << (res == CURLE_OK ? "HTTP " + std::to_string(response.status)
                                          : std::string(curl_easy_strerror(res)))
                      << ")\n";
            std::this_thread::sleep_for(
                std::chrono::milliseconds(100 * (1 << attempt)));  // 100ms, 200ms, 400ms
        }
    }

    curl_slist_free_all(hdrs);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);

    if (res != CURLE_OK) {
        throw HttpError(std::string("[HTTP] ") + curl_easy_strerror(res) + " (" + url + ")");
    }
    if (response.status >= 400) {
        throw HttpError("[HTTP] status " + std::to_string(response.status) + " from " + url,
                        response.status);
    }
    return response;
}
