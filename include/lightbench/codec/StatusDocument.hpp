#pragma once

#include <nlohmann/json.hpp>
#include "lightbench/codec/LightStatus.hpp"

namespace lightbench {

// {"fetch":{"output":{"carStatus":{"name":..,"exteriorLight":..}}}}
nlohmann::json makeStatusDocument(const StatusEnvelope& env);

// Inverse of makeStatusDocument. Throws DecodeError on a missing member,
// a wrongly typed member or an unknown status name.
StatusEnvelope parseStatusDocument(const nlohmann::json& doc);

} // namespace lightbench
