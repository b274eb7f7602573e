#include "gfs_common/clock.hpp"

#include <chrono>

namespace gfs_common {

Timestamp SystemClock::Now() const {
    return std::chrono::duration_cast<Timestamp>(
        std::chrono::system_clock::now().time_since_epoch());
}

ManualClock::ManualClock(Timestamp start) : now_ms_(start.count()) {}

Timestamp ManualClock::Now() const {
    return Timestamp(now_ms_.load());
}

void ManualClock::Advance(Timestamp delta) {
    now_ms_.fetch_add(delta.count());
}

void ManualClock::Set(Timestamp now) {
    now_ms_.store(now.count());
}

}  // namespace gfs_common
