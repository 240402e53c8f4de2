#pragma once

#include <chrono>
#include <cstdint>

namespace clearhouse::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;
using MonoDur   = MonoClock::duration;

inline MonoTime now() noexcept {
    return MonoClock::now();
}

inline int64_t ms_until(MonoTime deadline, MonoTime from) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - from
    ).count();
}

// ---------------------------------------------------------------------------
// Clock seam for the solve governor. Deadlines are always monotonic; wall
// time only enters through order timestamps (unix seconds) supplied with the
// auction snapshot.
// ---------------------------------------------------------------------------
class Clock {
public:
    virtual ~Clock() = default;
    virtual MonoTime now() const = 0;
};

class SteadyClock final : public Clock {
public:
    MonoTime now() const override { return MonoClock::now(); }
};

} // namespace clearhouse::infra
