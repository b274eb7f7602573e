#include "gfs_master/metadata_store.hpp"

#include <utility>

namespace gfs_master {

// ============================================================================
// Files
// ============================================================================

bool MetadataStore::FileExists(const std::string& path) const {
    return files_.find(path) != files_.end();
}

bool MetadataStore::AddFile(const std::string& path) {
    return files_.emplace(path, FileMetadata(path)).second;
}

FileMetadata* MetadataStore::FindFile(const std::string& path) {
    auto it = files_.find(path);
    if (it != files_.end()) {
        return &it->second;
    }
    return nullptr;
}

size_t MetadataStore::FileCount() const {
    return files_.size();
}

// ============================================================================
// Chunks: handles come from a counter and are never reused
// ============================================================================

ChunkHandle MetadataStore::AddChunk(const std::string& path,
                                    std::vector<ChunkserverId> replicas) {
    ChunkHandle handle = next_handle_++;
    chunks_.emplace(handle, ChunkMetadata(handle, std::move(replicas)));
    files_.at(path).chunk_handles.push_back(handle);
    return handle;
}

ChunkMetadata* MetadataStore::FindChunk(ChunkHandle handle) {
    auto it = chunks_.find(handle);
    if (it != chunks_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool MetadataStore::ChunkExists(ChunkHandle handle) const {
    return chunks_.find(handle) != chunks_.end();
}

size_t MetadataStore::ChunkCount() const {
    return chunks_.size();
}

// ============================================================================
// Chunkserver registry
// ============================================================================

std::pair<ChunkserverState*, bool> MetadataStore::UpsertChunkserver(const ChunkserverId& id) {
    auto result = chunkservers_.try_emplace(id);
    return {&result.first->second, result.second};
}

ChunkserverState* MetadataStore::FindChunkserver(const ChunkserverId& id) {
    auto it = chunkservers_.find(id);
    if (it != chunkservers_.end()) {
        return &it->second;
    }
    return nullptr;
}

}  // namespace gfs_master
