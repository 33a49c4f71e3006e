#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio/ip/udp.hpp>

#include "lightbench/bridge/ExecutionBridge.hpp"
#include "lightbench/codec/StatusCodec.hpp"
#include "lightbench/coap/CoapSession.hpp"
#include "lightbench/protocol/ProtocolAdapter.hpp"

namespace lightbench {

using CoapBridge = ExecutionBridge<coap::CoapSession>;

// Process-wide bridge for the CoAP transport, created on first use and
// kept until process exit. Concurrent first calls create it once. The
// transmission parameters of the first successful call win.
// Throws BridgeStartupError; a later call retries.
CoapBridge& sharedCoapBridge(const coap::TransmissionParams& params,
                             std::chrono::milliseconds startup_grace);

struct DatagramConfig {
    std::string host = "localhost";
    uint16_t port = 5683;
    std::string path = "60001";
    std::chrono::milliseconds timeout{10000};
    coap::TransmissionParams transmission;
    std::chrono::milliseconds startup_grace{10000};
};

// CoAP FETCH with the vehicle name as a text/plain body. The response body
// must decode as a status record; if it does not, the outcome keeps its
// latency and size but is flagged DecodeError.
class DatagramAdapter : public ProtocolAdapter {
public:
    // Throws BridgeStartupError when the shared bridge cannot be started.
    DatagramAdapter(DatagramConfig cfg, StatusCodec codec);

    std::string label() const override { return "COAP"; }
    std::string requestName() const override { return "fetch"; }

    RequestOutcome fetch(const std::string& vehicle) noexcept override;

private:
    RequestOutcome interpret(const coap::FetchResult& result,
                             infra::MonoTime start,
                             infra::MonoDur elapsed) const;

    DatagramConfig cfg_;
    StatusCodec codec_;
    CoapBridge& bridge_;
    std::optional<boost::asio::ip::udp::endpoint> peer_;
    std::string resolve_error_;
};

} // namespace lightbench
