#pragma once

#include "gfs_master/metadata.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace gfs_master {

/**
 * MetadataStore: the master's in-memory tables.
 *
 *   files_        path   -> FileMetadata
 *   chunks_       handle -> ChunkMetadata
 *   chunkservers_ id     -> ChunkserverState (ordered by id)
 *
 * Not thread-safe. Owned by Master, which serializes every access under its
 * own mutex. Entries are never erased, so pointers returned by Find* stay
 * valid for the lifetime of the store.
 */
class MetadataStore {
public:
    MetadataStore() = default;

    // ========================================================================
    // Files
    // ========================================================================
    bool FileExists(const std::string& path) const;
    // false if the path already exists
    bool AddFile(const std::string& path);
    FileMetadata* FindFile(const std::string& path);
    size_t FileCount() const;

    // ========================================================================
    // Chunks
    // ========================================================================

    /**
     * Issue the next handle, record its metadata (no lease) and append it to
     * the file. The file must exist.
     */
    ChunkHandle AddChunk(const std::string& path, std::vector<ChunkserverId> replicas);
    ChunkMetadata* FindChunk(ChunkHandle handle);
    bool ChunkExists(ChunkHandle handle) const;
    size_t ChunkCount() const;
    // Handle AddChunk will issue next
    ChunkHandle PeekNextHandle() const { return next_handle_; }
    const std::map<ChunkHandle, ChunkMetadata>& chunks() const { return chunks_; }

    // ========================================================================
    // Chunkserver registry
    // ========================================================================

    // Inserts a fresh entry on first sight; second member is true if new
    std::pair<ChunkserverState*, bool> UpsertChunkserver(const ChunkserverId& id);
    ChunkserverState* FindChunkserver(const ChunkserverId& id);
    std::map<ChunkserverId, ChunkserverState>& chunkservers() { return chunkservers_; }

private:
    std::unordered_map<std::string, FileMetadata> files_;
    std::map<ChunkHandle, ChunkMetadata> chunks_;
    std::map<ChunkserverId, ChunkserverState> chunkservers_;
    ChunkHandle next_handle_ = 1;  // handle 0 is never issued
};

}  // namespace gfs_master
