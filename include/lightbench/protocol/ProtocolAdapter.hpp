#pragma once

#include <memory>
#include <string>

#include "lightbench/core/Outcome.hpp"

namespace lightbench {

// One "fetch light status" round trip over one transport.
class ProtocolAdapter {
public:
    virtual ~ProtocolAdapter() = default;

    // Protocol label used to group statistics ("JSONRPC", "COAP", "REST").
    virtual std::string label() const = 0;

    // Request name reported next to the label ("fetch", "externalLights").
    virtual std::string requestName() const = 0;

    // Safe to call from many worker threads at once. Never throws: every
    // failure ends up in the outcome's error class.
    virtual RequestOutcome fetch(const std::string& vehicle) noexcept = 0;
};

using AdapterPtr = std::shared_ptr<ProtocolAdapter>;

struct WeightedAdapter {
    AdapterPtr adapter;
    int weight = 1;
};

} // namespace lightbench
