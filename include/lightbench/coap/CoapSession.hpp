#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "lightbench/coap/CoapMessage.hpp"
#include "lightbench/infra/Clock.hpp"

namespace lightbench::coap {

// RFC 7252 section 4.8, without the random factor.
struct TransmissionParams {
    std::chrono::milliseconds ack_timeout{2000};
    int max_retransmit = 4;
};

struct FetchResult {
    enum class Status {
        Response,
        Timeout,
        Reset,
        SocketError
    };

    Status status = Status::Timeout;
    Message response;       // valid when status == Response
    std::string error;
};

// ---------------------------------------------------------------------------
// CoAP client endpoint: one unconnected UDP socket, any number of peers.
// Not thread-safe. Every member, including the constructor, must run on
// the thread that runs the io_context (the execution bridge thread).
// ---------------------------------------------------------------------------
class CoapSession {
public:
    using Handler = std::function<void(FetchResult)>;

    CoapSession(boost::asio::io_context& ioc, TransmissionParams params);
    ~CoapSession();

    CoapSession(const CoapSession&) = delete;
    CoapSession& operator=(const CoapSession&) = delete;

    // Sends msg as a confirmable message with a fresh message id and
    // token. on_done runs exactly once: on the response, on RST, on a
    // socket error or when timeout expires.
    void request(const boost::asio::ip::udp::endpoint& peer,
                 Message msg,
                 infra::MonoDur timeout,
                 Handler on_done);

    size_t inFlight() const { return exchanges_.size(); }
    uint16_t localPort() const;

private:
    struct Exchange;
    using ExchangePtr = std::shared_ptr<Exchange>;

    void startReceive();
    void onDatagram(size_t n);
    void transmit(const ExchangePtr& ex);
    void armRetransmit(const ExchangePtr& ex);
    void finish(uint64_t key, FetchResult result);
    void sendEmpty(const boost::asio::ip::udp::endpoint& to,
                   MessageType type, uint16_t message_id);
    ExchangePtr byMessageId(uint16_t message_id) const;

    boost::asio::io_context& ioc_;
    TransmissionParams params_;
    boost::asio::ip::udp::socket socket_;
    std::vector<uint8_t> rx_;
    boost::asio::ip::udp::endpoint rx_from_;
    uint16_t next_mid_;
    uint64_t next_token_;
    std::unordered_map<uint64_t, ExchangePtr> exchanges_;
};

} // namespace lightbench::coap
