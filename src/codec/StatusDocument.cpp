#include "lightbench/codec/StatusDocument.hpp"
#include "lightbench/core/Errors.hpp"

using json = nlohmann::json;

namespace lightbench {

json makeStatusDocument(const StatusEnvelope& env) {
    return json{
        {"fetch", {
            {"output", {
                {"carStatus", {
                    {"name", env.name},
                    {"exteriorLight", statusName(env.status)}
                }}
            }}
        }}
    };
}

static const json& member(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw DecodeError(std::string("status document: missing '") +
                          key + "'");
    }
    return obj.at(key);
}

StatusEnvelope parseStatusDocument(const json& doc) {
    const json& car = member(member(member(doc, "fetch"), "output"),
                             "carStatus");
    const json& name = member(car, "name");
    const json& light = member(car, "exteriorLight");
    if (!name.is_string() || !light.is_string()) {
        throw DecodeError("status document: carStatus members must be strings");
    }

    StatusEnvelope env;
    env.name = name.get<std::string>();
    try {
        env.status = statusFromName(light.get<std::string>());
    } catch (const UnknownStatusError& e) {
        throw DecodeError(std::string("status document: ") + e.what());
    }
    return env;
}

} // namespace lightbench
