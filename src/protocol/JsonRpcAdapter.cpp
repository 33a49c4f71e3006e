#include "lightbench/protocol/JsonRpcAdapter.hpp"
#include "lightbench/codec/StatusDocument.hpp"
#include "lightbench/core/Errors.hpp"
#include "lightbench/infra/Debug.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lightbench {

JsonRpcAdapter::JsonRpcAdapter(HttpEndpointConfig cfg)
    : cfg_(std::move(cfg)), http_(cfg_.url, cfg_.timeout) {}

RequestOutcome JsonRpcAdapter::fetch(const std::string& vehicle) noexcept {
    const infra::MonoTime start = infra::now();
    try {
        json payload = {
            {"jsonrpc", "2.0"},
            {"method", "fetch"},
            {"params", json::array({vehicle})},
            {"id", next_id_.fetch_add(1)}
        };

        HttpResponse resp = http_.postJson(payload.dump());
        const infra::MonoDur elapsed = infra::now() - start;
        return interpret(resp, vehicle, start, elapsed);
    } catch (const std::exception& e) {
        return RequestOutcome::failed(label(), requestName(), start,
                                      infra::now() - start, 0,
                                      ErrorClass::TransportError, e.what());
    }
}

RequestOutcome JsonRpcAdapter::interpret(const HttpResponse& resp,
                                         const std::string& vehicle,
                                         infra::MonoTime start,
                                         infra::MonoDur elapsed) const {
    if (!resp.delivered()) {
        return RequestOutcome::failed(label(), requestName(), start, elapsed, 0,
                                      classifyCurl(resp.code), resp.error);
    }

    const uint64_t bytes = resp.body.size();
    if (resp.status != 200) {
        return RequestOutcome::failed(label(), requestName(), start, elapsed, bytes,
                                      ErrorClass::ProtocolError,
                                      "HTTP " + std::to_string(resp.status));
    }

    json body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded()) {
        return RequestOutcome::failed(label(), requestName(), start, elapsed, bytes,
                                      ErrorClass::DecodeError,
                                      "response body is not JSON");
    }

    if (body.is_object() && body.contains("error") && !body["error"].is_null()) {
        const json& err = body["error"];
        std::string msg = err.is_object() && err.contains("message")
                              ? err["message"].dump()
                              : err.dump();
        return RequestOutcome::failed(label(), requestName(), start, elapsed, bytes,
                                      ErrorClass::ProtocolError,
                                      "rpc error " + msg);
    }

    RequestOutcome out = RequestOutcome::ok(label(), requestName(), start,
                                            elapsed, bytes);

    // The result is informational; a shape we do not know still counts as
    // a successful call.
    if (body.is_object() && body.contains("result")) {
        const json& result = body["result"];
        try {
            if (result.is_object()) {
                out.status = parseStatusDocument(result);
            } else if (result.is_string()) {
                out.status = StatusEnvelope{vehicle,
                                            statusFromName(result.get<std::string>())};
            }
        } catch (const LightbenchError& e) {
            if (infra::debugEnabled())
                std::cerr << "[JSONRPC] Unrecognised result: " << e.what() << "\n";
        }
    }
    return out;
}

} // namespace lightbench
