#pragma once

#include <cstdlib>

namespace lightbench::infra {

// Per-request diagnostics are only printed when LIGHTBENCH_DEBUG is set.
inline bool debugEnabled() {
    static const bool enabled = std::getenv("LIGHTBENCH_DEBUG") != nullptr;
    return enabled;
}

} // namespace lightbench::infra
