#include "gfs_master/replica_selector.hpp"

#include <algorithm>

namespace gfs_master {

ReplicaSelector::ReplicaSelector(int replication_factor)
    : replication_factor_(replication_factor) {}

std::vector<ChunkserverId> ReplicaSelector::SelectForAllocation(
    const std::vector<ChunkserverId>& alive) {

    std::vector<ChunkserverId> selected;
    size_t count = static_cast<size_t>(replication_factor_);
    if (replication_factor_ <= 0 || alive.size() < count) {
        return selected;
    }

    size_t start = round_robin_index_ % alive.size();
    for (size_t i = 0; i < count; ++i) {
        selected.push_back(alive[(start + i) % alive.size()]);
    }

    // Move round-robin pointer forward for next allocation
    round_robin_index_ = (start + count) % alive.size();

    std::sort(selected.begin(), selected.end());
    return selected;
}

std::optional<ChunkserverId> ReplicaSelector::SelectPrimary(
    const std::vector<ChunkserverId>& replicas,
    const std::function<bool(const ChunkserverId&)>& is_alive) {

    std::vector<ChunkserverId> ordered(replicas);
    std::sort(ordered.begin(), ordered.end());
    for (const auto& id : ordered) {
        if (is_alive(id)) {
            return id;
        }
    }
    return std::nullopt;
}

}  // namespace gfs_master
