#include "lightbench/codec/LightStatus.hpp"
#include "lightbench/core/Errors.hpp"

#include <unordered_map>

namespace lightbench {

namespace {

// Code -> name and name -> code, both built from the same table once.
struct StatusTable {
    std::array<std::string, kLightStatusCount> names;
    std::unordered_map<std::string, LightStatus> by_name;

    StatusTable() {
        names = {
            "lowBeamHeadlightsOn",
            "highBeamHeadlightsOn",
            "leftTurnSignalOn",
            "rightTurnSignalOn",
            "daytimeRunningLightsOn",
            "reverseLightOn",
            "fogLightOn",
            "parkingLightsOn"
        };
        for (LightStatus s : kAllLightStatuses) {
            by_name.emplace(names[statusCode(s)], s);
        }
    }
};

const StatusTable& table() {
    static const StatusTable t;
    return t;
}

}

const std::string& statusName(LightStatus s) {
    return table().names[statusCode(s)];
}

LightStatus statusFromCode(int64_t code) {
    if (code < 0 || code >= kLightStatusCount) {
        throw DecodeError("light status code out of range: " +
                          std::to_string(code));
    }
    return static_cast<LightStatus>(code);
}

LightStatus statusFromName(const std::string& name) {
    const auto& by_name = table().by_name;
    auto it = by_name.find(name);
    if (it == by_name.end()) {
        throw UnknownStatusError("unknown light status: '" + name + "'");
    }
    return it->second;
}

int lookupCodeForStatus(const std::string& name) {
    return statusCode(statusFromName(name));
}

LightStatus randomLightStatus(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, kLightStatusCount - 1);
    return static_cast<LightStatus>(dist(rng));
}

} // namespace lightbench
