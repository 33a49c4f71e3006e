#include "lightbench/protocol/HttpClient.hpp"

#include <stdexcept>

namespace lightbench {

static void globalCurlInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

ErrorClass classifyCurl(CURLcode code) {
    return code == CURLE_OPERATION_TIMEDOUT ? ErrorClass::Timeout
                                            : ErrorClass::TransportError;
}

HttpClient::HttpClient(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
    globalCurlInit();
}

HttpClient::~HttpClient() {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    for (CURL* h : idle_) {
        curl_easy_cleanup(h);
    }
    idle_.clear();
}

size_t HttpClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::Lease HttpClient::acquire() {
    {
        std::lock_guard<std::mutex> lock(pool_mtx_);
        if (!idle_.empty()) {
            CURL* h = idle_.back();
            idle_.pop_back();
            return Lease(h, HandleReturn{this});
        }
    }
    CURL* h = curl_easy_init();
    if (!h) throw std::runtime_error("[HTTP] curl_easy_init failed");
    return Lease(h, HandleReturn{this});
}

void HttpClient::release(CURL* h) {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    idle_.push_back(h);
}

HttpResponse HttpClient::postJson(const std::string& body) {
    Lease lease = acquire();
    CURL* curl = lease.get();

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {0};

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    const long timeout_ms = static_cast<long>(timeout_.count());

    curl_easy_setopt(curl, CURLOPT_URL,               url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER,        headers);
    curl_easy_setopt(curl, CURLOPT_POST,              1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS,        body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,     static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION,     write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA,         &resp.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER,       errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,        timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL,          1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE,     1L);

    resp.code = curl_easy_perform(curl);
    if (resp.code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    } else {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(resp.code);
    }

    // The handle outlives this call; detach everything that points at
    // stack memory.
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER,  nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA,   nullptr);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS,  nullptr);
    curl_slist_free_all(headers);

    return resp;
}

} // namespace lightbench
