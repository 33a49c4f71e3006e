#include "lightbench/coap/CoapSession.hpp"
#include "lightbench/core/Errors.hpp"
#include "lightbench/infra/Debug.hpp"

#include <iostream>
#include <random>

#include <boost/asio/buffer.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace lightbench::coap {

static constexpr size_t MAX_DATAGRAM = 65535;

struct CoapSession::Exchange {
    Exchange(asio::io_context& ioc, std::chrono::milliseconds first_backoff)
        : retransmit_timer(ioc), deadline(ioc), backoff(first_backoff) {}

    uint64_t key = 0;
    udp::endpoint peer;
    uint16_t message_id = 0;
    std::vector<uint8_t> token;
    std::vector<uint8_t> wire;
    bool acked = false;
    int retransmits = 0;
    asio::steady_timer retransmit_timer;
    asio::steady_timer deadline;
    std::chrono::milliseconds backoff;
    Handler on_done;
};

static uint64_t tokenKey(const std::vector<uint8_t>& token) {
    uint64_t key = 0;
    for (uint8_t b : token) key = (key << 8) | b;
    return key;
}

CoapSession::CoapSession(asio::io_context& ioc, TransmissionParams params)
    : ioc_(ioc),
      params_(params),
      socket_(ioc, udp::endpoint(udp::v4(), 0)),
      rx_(MAX_DATAGRAM) {
    std::random_device rd;
    next_mid_ = static_cast<uint16_t>(rd());
    next_token_ = (static_cast<uint64_t>(rd()) << 32) | rd();

    std::cout << "[COAP] Client endpoint bound to udp/" << localPort() << "\n";
    startReceive();
}

CoapSession::~CoapSession() {
    boost::system::error_code ec;
    socket_.close(ec);
}

uint16_t CoapSession::localPort() const {
    boost::system::error_code ec;
    return socket_.local_endpoint(ec).port();
}

void CoapSession::request(const udp::endpoint& peer,
                          Message msg,
                          infra::MonoDur timeout,
                          Handler on_done) {
    auto ex = std::make_shared<Exchange>(ioc_, params_.ack_timeout);

    msg.type = MessageType::Confirmable;
    msg.message_id = next_mid_++;
    const uint64_t tok = next_token_++;
    msg.token.clear();
    for (int shift = 56; shift >= 0; shift -= 8)
        msg.token.push_back(static_cast<uint8_t>(tok >> shift));

    ex->key = tokenKey(msg.token);
    ex->peer = peer;
    ex->message_id = msg.message_id;
    ex->token = msg.token;
    ex->wire = encode(msg);
    ex->on_done = std::move(on_done);

    exchanges_[ex->key] = ex;

    const uint64_t key = ex->key;
    ex->deadline.expires_after(timeout);
    ex->deadline.async_wait([this, key](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        FetchResult r;
        r.status = FetchResult::Status::Timeout;
        r.error = "no response before deadline";
        finish(key, std::move(r));
    });

    transmit(ex);
    armRetransmit(ex);
}

void CoapSession::transmit(const ExchangePtr& ex) {
    const uint64_t key = ex->key;
    socket_.async_send_to(
        asio::buffer(ex->wire), ex->peer,
        [this, ex, key](const boost::system::error_code& ec, size_t) {
            if (!ec || ec == asio::error::operation_aborted) return;
            FetchResult r;
            r.status = FetchResult::Status::SocketError;
            r.error = ec.message();
            finish(key, std::move(r));
        });
}

void CoapSession::armRetransmit(const ExchangePtr& ex) {
    if (ex->retransmits >= params_.max_retransmit) return;

    ex->retransmit_timer.expires_after(ex->backoff);
    std::weak_ptr<Exchange> weak = ex;
    ex->retransmit_timer.async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        ExchangePtr ex = weak.lock();
        if (!ex || ex->acked || exchanges_.count(ex->key) == 0) return;

        ++ex->retransmits;
        ex->backoff *= 2;
        if (infra::debugEnabled()) {
            std::cout << "[COAP] Retransmit mid=" << ex->message_id
                      << " attempt=" << ex->retransmits << "\n";
        }
        transmit(ex);
        armRetransmit(ex);
    });
}

void CoapSession::finish(uint64_t key, FetchResult result) {
    auto it = exchanges_.find(key);
    if (it == exchanges_.end()) return;

    ExchangePtr ex = it->second;
    exchanges_.erase(it);
    ex->retransmit_timer.cancel();
    ex->deadline.cancel();

    Handler done = std::move(ex->on_done);
    if (done) done(std::move(result));
}

CoapSession::ExchangePtr CoapSession::byMessageId(uint16_t message_id) const {
    for (const auto& kv : exchanges_) {
        if (kv.second->message_id == message_id) return kv.second;
    }
    return nullptr;
}

void CoapSession::sendEmpty(const udp::endpoint& to,
                            MessageType type, uint16_t message_id) {
    Message m;
    m.type = type;
    m.code = code::Empty;
    m.message_id = message_id;
    auto wire = std::make_shared<std::vector<uint8_t>>(encode(m));
    socket_.async_send_to(asio::buffer(*wire), to,
        [wire](const boost::system::error_code& ec, size_t) {
            if (ec && infra::debugEnabled())
                std::cerr << "[COAP] Empty message send failed: "
                          << ec.message() << "\n";
        });
}

void CoapSession::startReceive() {
    socket_.async_receive_from(
        asio::buffer(rx_), rx_from_,
        [this](const boost::system::error_code& ec, size_t n) {
            if (ec == asio::error::operation_aborted) return;
            if (ec) {
                if (infra::debugEnabled())
                    std::cerr << "[COAP] Receive error: " << ec.message() << "\n";
            } else {
                onDatagram(n);
            }
            startReceive();
        });
}

void CoapSession::onDatagram(size_t n) {
    Message msg;
    try {
        msg = decode(rx_.data(), n);
    } catch (const DecodeError& e) {
        if (infra::debugEnabled())
            std::cerr << "[COAP] Dropped datagram from " << rx_from_
                      << ": " << e.what() << "\n";
        return;
    }

    if (msg.type == MessageType::Reset) {
        if (ExchangePtr ex = byMessageId(msg.message_id)) {
            FetchResult r;
            r.status = FetchResult::Status::Reset;
            r.error = "reset by peer";
            finish(ex->key, std::move(r));
        }
        return;
    }

    if (msg.type == MessageType::Acknowledgement && msg.isEmpty()) {
        // Separate response follows; stop retransmitting.
        if (ExchangePtr ex = byMessageId(msg.message_id)) {
            ex->acked = true;
            ex->retransmit_timer.cancel();
        }
        return;
    }

    const uint64_t key = tokenKey(msg.token);
    auto it = exchanges_.find(key);
    const bool known = it != exchanges_.end() && it->second->token == msg.token;

    if (msg.type == MessageType::Confirmable) {
        // Separate responses are acknowledged; strangers get RST.
        sendEmpty(rx_from_, known ? MessageType::Acknowledgement
                                  : MessageType::Reset,
                  msg.message_id);
    }
    if (!known) return;

    FetchResult r;
    r.status = FetchResult::Status::Response;
    r.response = std::move(msg);
    finish(key, std::move(r));
}

} // namespace lightbench::coap
