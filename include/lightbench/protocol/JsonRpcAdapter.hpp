#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "lightbench/protocol/HttpClient.hpp"
#include "lightbench/protocol/ProtocolAdapter.hpp"

namespace lightbench {

// JSON-RPC 2.0 "fetch" call with the vehicle name as the only positional
// parameter. Success is HTTP 200 with a JSON body that carries no error
// member.
class JsonRpcAdapter : public ProtocolAdapter {
public:
    explicit JsonRpcAdapter(HttpEndpointConfig cfg);

    std::string label() const override { return "JSONRPC"; }
    std::string requestName() const override { return "fetch"; }

    RequestOutcome fetch(const std::string& vehicle) noexcept override;

private:
    RequestOutcome interpret(const HttpResponse& resp,
                             const std::string& vehicle,
                             infra::MonoTime start,
                             infra::MonoDur elapsed) const;

    HttpEndpointConfig cfg_;
    HttpClient http_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace lightbench
