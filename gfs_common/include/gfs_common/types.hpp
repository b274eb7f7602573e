#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gfs_common {

using ChunkHandle = uint64_t;
using ChunkVersion = uint64_t;
using ChunkserverId = std::string;

// Milliseconds since the owning clock's epoch
using Timestamp = std::chrono::milliseconds;

enum class AppendRole {
    kPrimary,
    kSecondary
};

/**
 * Result of AllocateChunk: the fresh handle and where it was placed.
 * replicas is sorted by ascending chunkserver id.
 */
struct ChunkAllocation {
    ChunkHandle handle = 0;
    std::vector<ChunkserverId> replicas;
};

/**
 * Result of GetOrGrantLease.
 * secondaries holds every replica except the primary, ascending.
 */
struct LeaseGrant {
    ChunkserverId primary;
    std::vector<ChunkserverId> secondaries;
    ChunkVersion version = 0;
    Timestamp expiry{0};
};

/**
 * Result of GetChunkLocations.
 *
 * replicas       - full replica set, ascending
 * alive_replicas - subset the master currently considers alive, ascending
 * primary        - set only while the lease is still valid
 */
struct ChunkLocations {
    std::vector<ChunkserverId> replicas;
    std::vector<ChunkserverId> alive_replicas;
    std::optional<ChunkserverId> primary;
};

// length == 0 reads from offset to the end of the chunk
struct ByteRange {
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct ChunkInfo {
    uint64_t size = 0;
    ChunkVersion version = 0;
    std::string checksum;  // SHA-256, lowercase hex
};

}  // namespace gfs_common
