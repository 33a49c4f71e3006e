#pragma once

#include <chrono>

namespace lightbench::infra {

// All latency measurement uses the monotonic clock; system_clock may jump.
using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;
using MonoDur   = MonoClock::duration;

inline MonoTime now() noexcept {
    return MonoClock::now();
}

inline double to_ms(MonoDur d) noexcept {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace lightbench::infra
