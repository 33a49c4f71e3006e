#include "lightbench/core/Outcome.hpp"

namespace lightbench {

const char* errorClassName(ErrorClass e) {
    switch (e) {
    case ErrorClass::Timeout:            return "Timeout";
    case ErrorClass::TransportError:     return "TransportError";
    case ErrorClass::ProtocolError:      return "ProtocolError";
    case ErrorClass::DecodeError:        return "DecodeError";
    case ErrorClass::UnknownStatusError: return "UnknownStatusError";
    case ErrorClass::BridgeStartupError: return "BridgeStartupError";
    }
    return "Unknown";
}

RequestOutcome RequestOutcome::ok(std::string protocol, std::string name,
                                  infra::MonoTime start, infra::MonoDur elapsed,
                                  uint64_t bytes) {
    RequestOutcome o;
    o.protocol = std::move(protocol);
    o.name = std::move(name);
    o.start = start;
    o.elapsed = elapsed;
    o.response_bytes = bytes;
    o.success = true;
    return o;
}

RequestOutcome RequestOutcome::failed(std::string protocol, std::string name,
                                      infra::MonoTime start, infra::MonoDur elapsed,
                                      uint64_t bytes, ErrorClass error,
                                      std::string detail) {
    RequestOutcome o;
    o.protocol = std::move(protocol);
    o.name = std::move(name);
    o.start = start;
    o.elapsed = elapsed;
    o.response_bytes = bytes;
    o.success = false;
    o.error = error;
    o.detail = std::move(detail);
    return o;
}

} // namespace lightbench
