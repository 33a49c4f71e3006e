#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace lightbench::test {

struct StubResponse {
    unsigned status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::milliseconds delay{0};
};

// Single-threaded HTTP/1.1 server on 127.0.0.1 with an ephemeral port.
// One request per connection; the handler decides the reply.
class HttpStubServer {
public:
    using Handler = std::function<StubResponse(const std::string& target,
                                               const std::string& body)>;

    explicit HttpStubServer(Handler handler);
    ~HttpStubServer();

    HttpStubServer(const HttpStubServer&) = delete;
    HttpStubServer& operator=(const HttpStubServer&) = delete;

    uint16_t port() const { return port_; }
    std::string url(const std::string& path) const;

    size_t requests() const { return requests_.load(); }
    std::string lastBody() const;

    void stop();

private:
    void run();

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<size_t> requests_{0};
    mutable std::mutex mtx_;
    std::string last_body_;
    std::thread thread_;
};

// A TCP port on 127.0.0.1 that nothing listens on.
uint16_t unusedTcpPort();

} // namespace lightbench::test
