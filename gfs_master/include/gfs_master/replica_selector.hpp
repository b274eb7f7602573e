#pragma once

#include "gfs_common/types.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace gfs_master {

using gfs_common::ChunkserverId;

/**
 * ReplicaSelector: replica placement and primary choice.
 *
 * Placement is a deterministic round-robin over the alive chunkservers sorted
 * by id; the same sequence of calls with the same alive sets always yields the
 * same placements. Not thread-safe (Master calls it under its mutex).
 */
class ReplicaSelector {
public:
    explicit ReplicaSelector(int replication_factor);

    /**
     * Pick replication_factor servers out of alive (ascending, unique).
     * Returns an empty vector, and leaves the rotation untouched, if there are
     * not enough alive servers. The result is sorted ascending.
     */
    std::vector<ChunkserverId> SelectForAllocation(const std::vector<ChunkserverId>& alive);

    // First alive member of replicas (ascending), if any
    static std::optional<ChunkserverId> SelectPrimary(
        const std::vector<ChunkserverId>& replicas,
        const std::function<bool(const ChunkserverId&)>& is_alive);

    int replication_factor() const { return replication_factor_; }

private:
    int replication_factor_;
    size_t round_robin_index_ = 0;
};

}  // namespace gfs_master
