#pragma once

#include <stdexcept>
#include <string>

namespace lightbench {

class LightbenchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed, truncated or out-of-range payload.
class DecodeError : public LightbenchError {
public:
    using LightbenchError::LightbenchError;
};

// Encode-side lookup of a status name that is not in the table.
class UnknownStatusError : public LightbenchError {
public:
    using LightbenchError::LightbenchError;
};

// The background scheduler of an execution bridge did not come up.
// Fatal for the adapter that asked for the bridge only.
class BridgeStartupError : public LightbenchError {
public:
    using LightbenchError::LightbenchError;
};

// Compiled template does not have the shape the schema path describes.
class SchemaError : public LightbenchError {
public:
    using LightbenchError::LightbenchError;
};

class ConfigError : public LightbenchError {
public:
    using LightbenchError::LightbenchError;
};

} // namespace lightbench
