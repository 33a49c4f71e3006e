#include "support/CoapStubServer.hpp"
#include "lightbench/core/Errors.hpp"

#include <chrono>
#include <iostream>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace lightbench::test {

CoapStubServer::CoapStubServer(Handler handler)
    : handler_(std::move(handler)),
      socket_(ioc_, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    socket_.non_blocking(true);
    port_ = socket_.local_endpoint().port();
    thread_ = std::thread([this] { run(); });
}

CoapStubServer::~CoapStubServer() {
    stop();
}

void CoapStubServer::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

std::optional<coap::Message> CoapStubServer::lastRequest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_;
}

void CoapStubServer::send(const coap::Message& m, const udp::endpoint& to) {
    boost::system::error_code ec;
    const std::vector<uint8_t> wire = coap::encode(m);
    socket_.send_to(asio::buffer(wire), to, 0, ec);
    if (ec) std::cerr << "[STUB] coap send: " << ec.message() << "\n";
}

void CoapStubServer::run() {
    std::vector<uint8_t> buf(65535);

    while (running_.load()) {
        udp::endpoint from;
        boost::system::error_code ec;
        const size_t n = socket_.receive_from(asio::buffer(buf), from, 0, ec);

        if (ec == asio::error::would_block) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (ec) continue;

        coap::Message req;
        try {
            req = coap::decode(buf.data(), n);
        } catch (const DecodeError& e) {
            std::cerr << "[STUB] coap: " << e.what() << "\n";
            continue;
        }

        if (req.type == coap::MessageType::Acknowledgement && req.isEmpty()) {
            ++acks_;
            continue;
        }
        if (req.isEmpty() || coap::codeClass(req.code) != 0) continue;

        ++requests_;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            last_ = req;
        }

        CoapReply reply = handler_(req);
        if (!reply.respond) continue;

        if (reply.reset) {
            coap::Message rst;
            rst.type = coap::MessageType::Reset;
            rst.code = coap::code::Empty;
            rst.message_id = req.message_id;
            send(rst, from);
            continue;
        }

        coap::Message res;
        res.code = reply.code;
        res.token = req.token;
        res.payload = reply.payload;
        if (reply.content_format) {
            res.addUintOption(coap::option::ContentFormat, *reply.content_format);
        }

        if (reply.separate) {
            coap::Message ack;
            ack.type = coap::MessageType::Acknowledgement;
            ack.code = coap::code::Empty;
            ack.message_id = req.message_id;
            send(ack, from);

            res.type = coap::MessageType::Confirmable;
            res.message_id = next_mid_++;
        } else {
            res.type = coap::MessageType::Acknowledgement;
            res.message_id = req.message_id;
        }
        send(res, from);
    }
}

uint16_t unusedUdpPort() {
    asio::io_context ioc;
    udp::socket scratch(ioc, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = scratch.local_endpoint().port();
    scratch.close();
    return port;
}

} // namespace lightbench::test
