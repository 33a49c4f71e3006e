#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace lightbench {

// Exterior light status of a vehicle. The numeric value is the wire code.
enum class LightStatus : uint8_t {
    LowBeamOn        = 0,
    HighBeamOn       = 1,
    LeftTurnOn       = 2,
    RightTurnOn      = 3,
    DaytimeRunningOn = 4,
    ReverseOn        = 5,
    FogOn            = 6,
    ParkingOn        = 7
};

constexpr int kLightStatusCount = 8;

constexpr std::array<LightStatus, kLightStatusCount> kAllLightStatuses = {
    LightStatus::LowBeamOn,  LightStatus::HighBeamOn,
    LightStatus::LeftTurnOn, LightStatus::RightTurnOn,
    LightStatus::DaytimeRunningOn, LightStatus::ReverseOn,
    LightStatus::FogOn,      LightStatus::ParkingOn
};

// A named vehicle paired with its light status. Every protocol variant
// carries this as its logical payload.
struct StatusEnvelope {
    std::string name;
    LightStatus status = LightStatus::LowBeamOn;

    bool operator==(const StatusEnvelope& o) const {
        return name == o.name && status == o.status;
    }
    bool operator!=(const StatusEnvelope& o) const { return !(*this == o); }
};

inline int statusCode(LightStatus s) {
    return static_cast<int>(s);
}

const std::string& statusName(LightStatus s);

// Throws DecodeError when code is outside 0-7.
LightStatus statusFromCode(int64_t code);

// Throws UnknownStatusError when name is not one of the 8 table entries.
LightStatus statusFromName(const std::string& name);

// Throws UnknownStatusError.
int lookupCodeForStatus(const std::string& name);

LightStatus randomLightStatus(std::mt19937& rng);

} // namespace lightbench
