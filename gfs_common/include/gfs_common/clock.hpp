#pragma once

#include "gfs_common/types.hpp"
#include <atomic>
#include <cstdint>

namespace gfs_common {

/**
 * Clock: source of "now" for lease expiry and liveness decisions.
 *
 * Master and chunkservers take a shared Clock so tests can drive time by hand.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp Now() const = 0;
};

// Wall clock, milliseconds since the Unix epoch (comparable across processes)
class SystemClock final : public Clock {
public:
    Timestamp Now() const override;
};

// Thread-safe clock that only moves when told to
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(0));

    Timestamp Now() const override;
    void Advance(Timestamp delta);
    void Set(Timestamp now);

private:
    std::atomic<int64_t> now_ms_;
};

}  // namespace gfs_common
