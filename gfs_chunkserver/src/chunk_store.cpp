#include "gfs_chunkserver/chunk_store.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <openssl/sha.h>
#include <sstream>

namespace gfs_chunkserver {

using gfs_common::ErrorCode;

ChunkStore::ChunkStore(uint64_t chunk_size) : chunk_size_(chunk_size) {}

ChunkStore::~ChunkStore() {
    std::unique_lock<std::shared_mutex> lock(chunks_mutex_);
    std::cout << "ChunkStore destroyed. Held " << chunks_.size()
              << " chunks." << std::endl;
}

std::shared_ptr<ChunkStore::Chunk> ChunkStore::FindChunk(ChunkHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex_);
    auto it = chunks_.find(handle);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return it->second;
}

std::string ChunkStore::CalculateChecksum(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

Status ChunkStore::CreateChunk(ChunkHandle handle, ChunkVersion version) {
    std::unique_lock<std::shared_mutex> lock(chunks_mutex_);
    if (chunks_.find(handle) != chunks_.end()) {
        return Status(ErrorCode::kChunkExists,
                      "chunk " + std::to_string(handle) + " already stored");
    }

    auto chunk = std::make_shared<Chunk>();
    chunk->version = version;
    chunks_.emplace(handle, std::move(chunk));
    return Status::OK();
}

Status ChunkStore::ReadChunk(ChunkHandle handle, uint64_t offset, uint64_t length,
                             std::string& out_data) {
    auto chunk = FindChunk(handle);
    if (!chunk) {
        return Status(ErrorCode::kChunkNotFound,
                      "chunk " + std::to_string(handle) + " not stored");
    }

    std::lock_guard<std::mutex> lock(chunk->mutex);
    uint64_t chunk_length = chunk->data.length();

    if (offset >= chunk_length) {
        // Offset beyond chunk - return empty
        out_data.clear();
        return Status::OK();
    }

    uint64_t actual_length = chunk_length - offset;
    if (length != 0) {
        actual_length = std::min(length, actual_length);
    }
    out_data = chunk->data.substr(offset, actual_length);
    return Status::OK();
}

Status ChunkStore::AppendChunk(ChunkHandle handle, const std::string& data,
                               ChunkVersion version) {
    auto chunk = FindChunk(handle);
    if (!chunk) {
        return Status(ErrorCode::kChunkNotFound,
                      "chunk " + std::to_string(handle) + " not stored");
    }

    std::lock_guard<std::mutex> lock(chunk->mutex);
    if (chunk->data.length() + data.length() > chunk_size_) {
        return Status(ErrorCode::kChunkFull,
                      "chunk " + std::to_string(handle) + " has " +
                      std::to_string(chunk_size_ - chunk->data.length()) +
                      " bytes left, append needs " + std::to_string(data.length()));
    }

    chunk->data.append(data);
    chunk->version = std::max(chunk->version, version);
    return Status::OK();
}

Status ChunkStore::GetChunkInfo(ChunkHandle handle, ChunkInfo& out_info) {
    auto chunk = FindChunk(handle);
    if (!chunk) {
        return Status(ErrorCode::kChunkNotFound,
                      "chunk " + std::to_string(handle) + " not stored");
    }

    std::lock_guard<std::mutex> lock(chunk->mutex);
    out_info.size = chunk->data.length();
    out_info.version = chunk->version;
    out_info.checksum = CalculateChecksum(chunk->data);
    return Status::OK();
}

std::unique_lock<std::mutex> ChunkStore::AcquireWriteOrder(ChunkHandle handle) {
    auto chunk = FindChunk(handle);
    if (!chunk) {
        return std::unique_lock<std::mutex>();
    }
    // Chunks are never removed, so the mutex outlives the lock
    return std::unique_lock<std::mutex>(chunk->write_order_mutex);
}

bool ChunkStore::ChunkExists(ChunkHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex_);
    return chunks_.find(handle) != chunks_.end();
}

std::vector<ChunkHandle> ChunkStore::GetAllChunks() const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex_);
    std::vector<ChunkHandle> handles;
    handles.reserve(chunks_.size());
    for (const auto& pair : chunks_) {
        handles.push_back(pair.first);
    }
    std::sort(handles.begin(), handles.end());
    return handles;
}

uint64_t ChunkStore::GetTotalStorageUsed() const {
    std::vector<std::shared_ptr<Chunk>> chunks;
    {
        std::shared_lock<std::shared_mutex> lock(chunks_mutex_);
        for (const auto& pair : chunks_) {
            chunks.push_back(pair.second);
        }
    }

    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        std::lock_guard<std::mutex> lock(chunk->mutex);
        total += chunk->data.length();
    }
    return total;
}

}  // namespace gfs_chunkserver
