#pragma once

#include "gfs_common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gfs_master {

using gfs_common::ChunkHandle;
using gfs_common::ChunkVersion;
using gfs_common::ChunkserverId;
using gfs_common::Timestamp;

struct FileMetadata {
    std::string path;
    std::vector<ChunkHandle> chunk_handles;  // append order

    explicit FileMetadata(const std::string& path = "");
};

struct ChunkMetadata {
    ChunkHandle handle;
    ChunkVersion version;
    std::vector<ChunkserverId> replicas;    // ascending, size == replication factor
    std::optional<ChunkserverId> primary;   // member of replicas when set
    std::optional<Timestamp> lease_expiry;

    ChunkMetadata(ChunkHandle handle = 0, std::vector<ChunkserverId> replicas = {});

    // Valid lease: a primary whose expiry is still in the future
    bool HasValidLease(Timestamp now) const;
    void ClearLease();
};

struct ChunkserverState {
    Timestamp last_heartbeat{0};
    std::vector<ChunkHandle> reported_chunks;
    bool alive = false;  // last liveness the master observed
};

}  // namespace gfs_master
