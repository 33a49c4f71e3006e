#include "support/HttpStubServer.hpp"

#include <iostream>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace lightbench::test {

HttpStubServer::HttpStubServer(Handler handler)
    : handler_(std::move(handler)),
      acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    acceptor_.non_blocking(true);
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { run(); });
}

HttpStubServer::~HttpStubServer() {
    stop();
}

void HttpStubServer::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

std::string HttpStubServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::string HttpStubServer::lastBody() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_body_;
}

void HttpStubServer::run() {
    while (running_.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);

        if (ec == asio::error::would_block) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }
        if (ec) continue;

        try {
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req);

            ++requests_;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                last_body_ = req.body();
            }

            StubResponse reply = handler_(std::string(req.target()), req.body());
            if (reply.delay.count() > 0) {
                std::this_thread::sleep_for(reply.delay);
            }

            http::response<http::string_body> res;
            res.version(req.version());
            res.result(static_cast<http::status>(reply.status));
            res.set(http::field::server, "lightbench-stub");
            res.set(http::field::content_type, reply.content_type);
            res.keep_alive(false);
            res.body() = reply.body;
            res.prepare_payload();
            http::write(socket, res);

            socket.shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            // Client gave up (timeout tests) or sent garbage.
            std::cerr << "[STUB] http: " << e.what() << "\n";
        }
    }
}

uint16_t unusedTcpPort() {
    asio::io_context ioc;
    tcp::acceptor scratch(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = scratch.local_endpoint().port();
    scratch.close();
    return port;
}

} // namespace lightbench::test
