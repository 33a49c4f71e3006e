#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "lightbench/codec/LightStatus.hpp"
#include "lightbench/infra/Clock.hpp"

namespace lightbench {

enum class ErrorClass {
    Timeout,
    TransportError,
    ProtocolError,
    DecodeError,
    UnknownStatusError,
    BridgeStartupError
};

const char* errorClassName(ErrorClass e);

// One completed or failed fetch attempt. Built once by an adapter, handed
// to the metrics sink by const reference and never changed afterwards.
struct RequestOutcome {
    std::string protocol;       // "JSONRPC", "COAP", "REST"
    std::string name;           // request name, e.g. "fetch"
    infra::MonoTime start{};
    infra::MonoDur elapsed{};
    uint64_t response_bytes = 0;
    bool success = false;
    std::optional<ErrorClass> error;
    std::string detail;
    std::optional<StatusEnvelope> status;

    double elapsedMs() const { return infra::to_ms(elapsed); }

    // A failure that carries no class counts as a transport error.
    ErrorClass failureClass() const {
        return error.value_or(ErrorClass::TransportError);
    }

    static RequestOutcome ok(std::string protocol, std::string name,
                             infra::MonoTime start, infra::MonoDur elapsed,
                             uint64_t bytes);

    static RequestOutcome failed(std::string protocol, std::string name,
                                 infra::MonoTime start, infra::MonoDur elapsed,
                                 uint64_t bytes, ErrorClass error,
                                 std::string detail);
};

} // namespace lightbench
