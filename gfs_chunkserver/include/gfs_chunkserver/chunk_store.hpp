#pragma once

#include "gfs_common/status.hpp"
#include "gfs_common/types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gfs_chunkserver {

using gfs_common::ChunkHandle;
using gfs_common::ChunkInfo;
using gfs_common::ChunkVersion;
using gfs_common::Status;

/**
 * ChunkStore: in-memory chunk bytes of one chunkserver
 *
 * Responsibilities:
 * - Keep one append-only buffer per chunk handle, bounded by chunk_size
 * - Track the version each chunk was last written at
 * - Report inventory for heartbeats and SHA-256 checksums for integrity checks
 *
 * Architecture:
 *   Chunkserver (roles, fan-out, heartbeats)
 *       ↓
 *   ChunkStore (bytes + per-chunk locking)
 *
 * Thread-safety:
 * - chunks_mutex_ (shared) guards the handle -> chunk map
 * - each chunk has its own mutex for its bytes, so appends to different
 *   chunks never contend and two appends to one chunk never interleave
 * - each chunk also has a write-order mutex that a primary holds across its
 *   local append and the fan-out, see AcquireWriteOrder()
 *
 * Usage:
 *   ChunkStore store(64 * 1024 * 1024);
 *   store.CreateChunk(7, 1);
 *   store.AppendChunk(7, "hello", 1);
 *   std::string data;
 *   store.ReadChunk(7, 0, 0, data);
 */
class ChunkStore {
public:
    explicit ChunkStore(uint64_t chunk_size);
    ~ChunkStore();

    // ChunkExists if the handle is already stored
    Status CreateChunk(ChunkHandle handle, ChunkVersion version);

    /**
     * Read part of a chunk
     *
     * - offset = 0, length = 0: whole chunk
     * - offset = N, length = 0: from N to end
     * - offset = N, length = M: at most M bytes from N
     * An offset past the end yields an empty result.
     *
     * @param out_data [OUTPUT] filled on success
     * @return ChunkNotFound if the handle is not stored
     */
    Status ReadChunk(ChunkHandle handle, uint64_t offset, uint64_t length,
                     std::string& out_data);

    /**
     * Append to the end of a chunk
     *
     * @param version write version; the stored version only moves forward
     * @return ChunkNotFound, or ChunkFull if size + data would exceed
     *         chunk_size (nothing is written then)
     */
    Status AppendChunk(ChunkHandle handle, const std::string& data, ChunkVersion version);

    // ChunkNotFound
    Status GetChunkInfo(ChunkHandle handle, ChunkInfo& out_info);

    /**
     * Serialize writers of one chunk beyond a single local append.
     *
     * The primary holds the returned lock while it appends locally and
     * forwards to its secondaries, so every secondary sees appends in the
     * primary's order. Returns an unlocked lock if the chunk is not stored.
     */
    std::unique_lock<std::mutex> AcquireWriteOrder(ChunkHandle handle);

    bool ChunkExists(ChunkHandle handle) const;

    // Ascending, for heartbeat reports
    std::vector<ChunkHandle> GetAllChunks() const;

    uint64_t GetTotalStorageUsed() const;

    uint64_t chunk_size() const { return chunk_size_; }

private:
    struct Chunk {
        std::mutex mutex;              // guards data and version
        std::mutex write_order_mutex;  // see AcquireWriteOrder()
        std::string data;
        ChunkVersion version = 0;
    };

    std::shared_ptr<Chunk> FindChunk(ChunkHandle handle) const;

    // SHA-256 of data, lowercase hex
    static std::string CalculateChecksum(const std::string& data);

    uint64_t chunk_size_;
    std::unordered_map<ChunkHandle, std::shared_ptr<Chunk>> chunks_;
    mutable std::shared_mutex chunks_mutex_;
};

}  // namespace gfs_chunkserver
