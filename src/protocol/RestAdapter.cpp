#include "lightbench/protocol/RestAdapter.hpp"
#include "lightbench/codec/StatusDocument.hpp"
#include "lightbench/core/Errors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lightbench {

RestAdapter::RestAdapter(HttpEndpointConfig cfg)
    : cfg_(std::move(cfg)), http_(cfg_.url, cfg_.timeout) {}

RequestOutcome RestAdapter::fetch(const std::string& vehicle) noexcept {
    const infra::MonoTime start = infra::now();
    try {
        const json payload = {{"carName", vehicle}};
        HttpResponse resp = http_.postJson(payload.dump());
        const infra::MonoDur elapsed = infra::now() - start;

        if (!resp.delivered()) {
            return RequestOutcome::failed(label(), requestName(), start, elapsed, 0,
                                          classifyCurl(resp.code), resp.error);
        }

        const uint64_t bytes = resp.body.size();
        if (!resp.is2xx()) {
            return RequestOutcome::failed(label(), requestName(), start, elapsed,
                                          bytes, ErrorClass::ProtocolError,
                                          "HTTP " + std::to_string(resp.status));
        }

        json body = json::parse(resp.body, nullptr, false);
        if (body.is_discarded()) {
            return RequestOutcome::failed(label(), requestName(), start, elapsed,
                                          bytes, ErrorClass::DecodeError,
                                          "response body is not JSON");
        }

        StatusEnvelope env;
        try {
            env = parseStatusDocument(body);
        } catch (const DecodeError& e) {
            return RequestOutcome::failed(label(), requestName(), start, elapsed,
                                          bytes, ErrorClass::DecodeError, e.what());
        }

        RequestOutcome out = RequestOutcome::ok(label(), requestName(), start,
                                                elapsed, bytes);
        out.status = std::move(env);
        return out;
    } catch (const std::exception& e) {
        return RequestOutcome::failed(label(), requestName(), start,
                                      infra::now() - start, 0,
                                      ErrorClass::TransportError, e.what());
    }
}

} // namespace lightbench
