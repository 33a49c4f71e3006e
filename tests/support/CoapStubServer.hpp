#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "lightbench/coap/CoapMessage.hpp"

namespace lightbench::test {

struct CoapReply {
    bool respond = true;           // false: stay silent
    bool separate = false;         // empty ACK first, then a CON response
    bool reset = false;            // answer with RST
    uint8_t code = coap::code::Content;
    std::vector<uint8_t> payload;
    std::optional<uint32_t> content_format = coap::kStatusRecordFormat;
};

// UDP CoAP server on 127.0.0.1 with an ephemeral port. Every CON/NON
// request is passed to the handler, retransmissions included.
class CoapStubServer {
public:
    using Handler = std::function<CoapReply(const coap::Message& request)>;

    explicit CoapStubServer(Handler handler);
    ~CoapStubServer();

    CoapStubServer(const CoapStubServer&) = delete;
    CoapStubServer& operator=(const CoapStubServer&) = delete;

    uint16_t port() const { return port_; }

    size_t requests() const { return requests_.load(); }
    size_t acksReceived() const { return acks_.load(); }
    std::optional<coap::Message> lastRequest() const;

    void stop();

private:
    void run();
    void send(const coap::Message& m, const boost::asio::ip::udp::endpoint& to);

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    uint16_t port_ = 0;
    uint16_t next_mid_ = 0x4000;
    std::atomic<bool> running_{true};
    std::atomic<size_t> requests_{0};
    std::atomic<size_t> acks_{0};
    mutable std::mutex mtx_;
    std::optional<coap::Message> last_;
    std::thread thread_;
};

// A UDP port on 127.0.0.1 that nothing is bound to.
uint16_t unusedUdpPort();

} // namespace lightbench::test
