#include "lightbench/protocol/AdapterFactory.hpp"
#include "lightbench/core/Errors.hpp"
#include "lightbench/protocol/DatagramAdapter.hpp"
#include "lightbench/protocol/JsonRpcAdapter.hpp"
#include "lightbench/protocol/RestAdapter.hpp"

#include <iostream>
#include <memory>

namespace lightbench {

AdapterPtr makeAdapter(const std::string& protocol, const BenchConfig& cfg) {
    if (protocol == "jsonrpc") {
        return std::make_shared<JsonRpcAdapter>(HttpEndpointConfig{cfg.jsonrpc.url, cfg.timeout});
    }
    if (protocol == "rest") {
        return std::make_shared<RestAdapter>(HttpEndpointConfig{cfg.rest.url, cfg.timeout});
    }
    if (protocol == "coap") {
        DatagramConfig dc;
        dc.host = cfg.coap.host;
        dc.port = cfg.coap.port;
        dc.path = cfg.coap.path;
        dc.timeout = cfg.timeout;
        dc.transmission.ack_timeout = cfg.coap.ack_timeout;
        dc.transmission.max_retransmit = cfg.coap.max_retransmit;
        dc.startup_grace = cfg.coap.startup_grace;
        return std::make_shared<DatagramAdapter>(dc, StatusCodec());
    }
    throw ConfigError("unknown protocol '" + protocol + "'");
}

std::vector<WeightedAdapter> buildAdapters(const BenchConfig& cfg) {
    struct Entry {
        const char* protocol;
        bool enabled;
        int weight;
    };
    const Entry entries[] = {
        {"jsonrpc", cfg.jsonrpc.enabled, cfg.jsonrpc.weight},
        {"coap",    cfg.coap.enabled,    cfg.coap.weight},
        {"rest",    cfg.rest.enabled,    cfg.rest.weight},
    };

    std::vector<WeightedAdapter> out;
    for (const Entry& e : entries) {
        if (!e.enabled || e.weight <= 0) continue;
        try {
            out.push_back(WeightedAdapter{makeAdapter(e.protocol, cfg), e.weight});
        } catch (const BridgeStartupError& ex) {
            std::cerr << "[LIGHTBENCH] Skipping " << e.protocol << ": " << ex.what() << "\n";
        }
    }
    return out;
}

} // namespace lightbench
