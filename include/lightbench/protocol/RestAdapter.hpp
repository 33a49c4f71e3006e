#pragma once

#include <string>

#include "lightbench/protocol/HttpClient.hpp"
#include "lightbench/protocol/ProtocolAdapter.hpp"

namespace lightbench {

// POST {"carName": <vehicle>} to the resource URL. Success is any 2xx with
// a JSON status document body.
class RestAdapter : public ProtocolAdapter {
public:
    explicit RestAdapter(HttpEndpointConfig cfg);

    std::string label() const override { return "REST"; }
    std::string requestName() const override { return "externalLights"; }

    RequestOutcome fetch(const std::string& vehicle) noexcept override;

private:
    HttpEndpointConfig cfg_;
    HttpClient http_;
};

} // namespace lightbench
