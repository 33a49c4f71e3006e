#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "lightbench/core/Outcome.hpp"

namespace lightbench {

struct HttpEndpointConfig {
    std::string url;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    CURLcode code = CURLE_OK;
    long status = 0;
    std::string body;
    std::string error;

    bool delivered() const { return code == CURLE_OK; }
    bool is2xx() const { return status >= 200 && status < 300; }
};

// Timeout for CURLE_OPERATION_TIMEDOUT, TransportError otherwise.
ErrorClass classifyCurl(CURLcode code);

// ---------------------------------------------------------------------------
// JSON POST client for one URL. Keeps a pool of persistent easy handles so
// that each concurrent caller reuses a kept-alive connection, the way a
// per-user HTTP session would.
// ---------------------------------------------------------------------------
class HttpClient {
public:
    HttpClient(std::string url, std::chrono::milliseconds timeout);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    const std::string& url() const { return url_; }

    // Transport failures are reported in the response, not thrown.
    // Throws std::runtime_error only if no curl handle can be created.
    HttpResponse postJson(const std::string& body);

private:
    struct HandleReturn {
        HttpClient* owner;
        void operator()(CURL* h) const { owner->release(h); }
    };
    using Lease = std::unique_ptr<CURL, HandleReturn>;

    Lease acquire();
    void release(CURL* h);

    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string url_;
    std::chrono::milliseconds timeout_;
    std::mutex pool_mtx_;
    std::vector<CURL*> idle_;
};

} // namespace lightbench
