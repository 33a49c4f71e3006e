#include "lightbench/protocol/DatagramAdapter.hpp"
#include "lightbench/core/Errors.hpp"
#include "lightbench/infra/Debug.hpp"

#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace lightbench {

// Extra wait on top of the request timeout for the hand-off back from the
// bridge thread, so the session's own Timeout result normally wins.
static constexpr std::chrono::milliseconds BRIDGE_SLACK{500};

CoapBridge& sharedCoapBridge(const coap::TransmissionParams& params,
                             std::chrono::milliseconds startup_grace) {
    static SharedBridge<coap::CoapSession> shared("coap-loop");
    return shared.get(
        [params](asio::io_context& ioc) {
            return std::make_unique<coap::CoapSession>(ioc, params);
        },
        startup_grace);
}

DatagramAdapter::DatagramAdapter(DatagramConfig cfg, StatusCodec codec)
    : cfg_(std::move(cfg)),
      codec_(std::move(codec)),
      bridge_(sharedCoapBridge(cfg_.transmission, cfg_.startup_grace)) {

    asio::io_context ioc;
    udp::resolver resolver(ioc);
    boost::system::error_code ec;
    auto results = resolver.resolve(udp::v4(), cfg_.host,
                                    std::to_string(cfg_.port), ec);
    if (ec || results.empty()) {
        resolve_error_ = "cannot resolve " + cfg_.host + ": " +
                         (ec ? ec.message() : std::string("no address"));
        std::cerr << "[COAP] " << resolve_error_ << "\n";
    } else {
        peer_ = results.begin()->endpoint();
        std::cout << "[COAP] Target coap://" << cfg_.host << ":" << cfg_.port
                  << "/" << cfg_.path << " (" << *peer_ << ")\n";
    }
}

RequestOutcome DatagramAdapter::fetch(const std::string& vehicle) noexcept {
    const infra::MonoTime start = infra::now();
    try {
        if (!peer_) {
            return RequestOutcome::failed(label(), requestName(), start,
                                          infra::now() - start, 0,
                                          ErrorClass::TransportError,
                                          resolve_error_);
        }

        coap::Message req;
        req.code = coap::code::Fetch;
        coap::setUriPath(req, cfg_.path);
        req.addUintOption(coap::option::ContentFormat, coap::format::TextPlain);
        req.payload.assign(vehicle.begin(), vehicle.end());

        const udp::endpoint peer = *peer_;
        const infra::MonoDur timeout = cfg_.timeout;

        std::optional<coap::FetchResult> result =
            bridge_.submit<coap::FetchResult>(
                [peer, req = std::move(req), timeout](
                    coap::CoapSession& session,
                    Completion<coap::FetchResult> done) mutable {
                    session.request(peer, std::move(req), timeout,
                                    [done](coap::FetchResult r) {
                                        done(std::move(r));
                                    });
                },
                cfg_.timeout + BRIDGE_SLACK);

        const infra::MonoDur elapsed = infra::now() - start;
        if (!result) {
            return RequestOutcome::failed(label(), requestName(), start, elapsed, 0,
                                          ErrorClass::Timeout,
                                          "bridge hand-off timed out");
        }
        return interpret(*result, start, elapsed);
    } catch (const std::exception& e) {
        return RequestOutcome::failed(label(), requestName(), start,
                                      infra::now() - start, 0,
                                      ErrorClass::TransportError, e.what());
    }
}

RequestOutcome DatagramAdapter::interpret(const coap::FetchResult& result,
                                          infra::MonoTime start,
                                          infra::MonoDur elapsed) const {
    switch (result.status) {
    case coap::FetchResult::Status::Timeout:
        return RequestOutcome::failed(label(), requestName(), start, elapsed, 0,
                                      ErrorClass::Timeout, result.error);
    case coap::FetchResult::Status::Reset:
    case coap::FetchResult::Status::SocketError:
        return RequestOutcome::failed(label(), requestName(), start, elapsed, 0,
                                      ErrorClass::TransportError, result.error);
    case coap::FetchResult::Status::Response:
        break;
    }

    const coap::Message& resp = result.response;
    const uint64_t bytes = resp.payload.size();

    if (coap::codeClass(resp.code) != 2) {
        return RequestOutcome::failed(label(), requestName(), start, elapsed, bytes,
                                      ErrorClass::ProtocolError,
                                      "response code " + coap::codeString(resp.code));
    }

    if (infra::debugEnabled()) {
        auto cf = resp.uintOption(coap::option::ContentFormat);
        if (!cf || *cf != coap::kStatusRecordFormat) {
            std::cerr << "[COAP] Unexpected content-format "
                      << (cf ? std::to_string(*cf) : std::string("none")) << "\n";
        }
    }

    try {
        StatusEnvelope env = codec_.decode(resp.payload);
        RequestOutcome out = RequestOutcome::ok(label(), requestName(), start,
                                                elapsed, bytes);
        out.status = std::move(env);
        return out;
    } catch (const DecodeError& e) {
        return RequestOutcome::failed(label(), requestName(), start, elapsed, bytes,
                                      ErrorClass::DecodeError, e.what());
    }
}

} // namespace lightbench
