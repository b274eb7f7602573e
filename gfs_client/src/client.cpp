#include "gfs_client/client.hpp"

#include <algorithm>
#include <iostream>

namespace gfs_client {

using gfs_common::AppendRole;
using gfs_common::ChunkAllocation;
using gfs_common::ChunkLocations;
using gfs_common::ErrorCode;
using gfs_common::LeaseGrant;

Client::Client(std::shared_ptr<gfs_common::MasterApi> master,
               std::shared_ptr<gfs_common::ChunkserverPool> chunkservers,
               const gfs_common::GfsConfig& config)
    : master_(std::move(master)),
      chunkservers_(std::move(chunkservers)),
      config_(config) {}

Status Client::Create(const std::string& path) {
    return master_->CreateFile(path);
}

void Client::SetReplicationFailureObserver(ReplicationFailureObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    replication_observer_ = std::move(observer);
}

// ============================================================================
// Write path
// ============================================================================

Status Client::Append(const std::string& path, const std::string& data) {
    if (data.length() > config_.chunk_size) {
        return Status(ErrorCode::kChunkFull,
                      "append of " + std::to_string(data.length()) +
                      " bytes can never fit a " + std::to_string(config_.chunk_size) +
                      " byte chunk");
    }

    // 1. Find the chunk to append to
    std::vector<ChunkHandle> handles;
    Status status = master_->GetFileChunks(path, handles);
    if (!status.ok()) {
        return status;
    }

    ChunkHandle handle;
    if (handles.empty()) {
        ChunkAllocation allocation;
        status = master_->AllocateChunk(path, allocation);
        if (!status.ok()) {
            return status;
        }
        handle = allocation.handle;
    } else {
        handle = handles.back();
    }

    // 2. Append, moving to a fresh chunk once if this one is full
    status = AppendToChunk(handle, data);
    if (status.code() == ErrorCode::kChunkFull) {
        std::cout << "[Client] Chunk " << handle << " of " << path
                  << " is full, retrying on a new chunk" << std::endl;

        ChunkAllocation allocation;
        Status allocated = master_->AllocateChunk(path, allocation);
        if (!allocated.ok()) {
            return allocated;
        }
        handle = allocation.handle;
        status = AppendToChunk(handle, data);
    }

    if (status.code() == ErrorCode::kReplicationFailed) {
        ReplicationFailureObserver observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            observer = replication_observer_;
        }
        std::cerr << "[Client] Append to " << path << " not fully replicated: "
                  << status << std::endl;
        if (observer) {
            observer(path, handle, status);
        }
        return status;
    }

    if (status.ok()) {
        std::cout << "[Client] Appended " << data.length() << " bytes to " << path
                  << " (chunk " << handle << ")" << std::endl;
    }
    return status;
}

Status Client::AppendToChunk(ChunkHandle handle, const std::string& data) {
    LeaseGrant lease;
    Status status = master_->GetOrGrantLease(handle, lease);
    if (!status.ok()) {
        return status;
    }

    status = EnsureReplicasCreated(handle, lease);
    if (!status.ok()) {
        return status;
    }

    auto primary = chunkservers_->Get(lease.primary);
    if (!primary) {
        return Status(ErrorCode::kChunkUnavailable,
                      "primary " + lease.primary + " of chunk " +
                      std::to_string(handle) + " is unreachable");
    }

    status = primary->Append(handle, data, AppendRole::kPrimary, lease.secondaries,
                             lease.version);
    if (status.code() == ErrorCode::kUnreachable) {
        return Status(ErrorCode::kChunkUnavailable, status.message());
    }
    return status;
}

Status Client::EnsureReplicasCreated(ChunkHandle handle, const LeaseGrant& lease) {
    std::vector<ChunkserverId> replicas;
    replicas.push_back(lease.primary);
    replicas.insert(replicas.end(), lease.secondaries.begin(), lease.secondaries.end());

    for (const auto& id : replicas) {
        if (IsConfirmed(handle, id)) {
            continue;
        }

        Status status;
        auto chunkserver = chunkservers_->Get(id);
        if (!chunkserver) {
            status = Status(ErrorCode::kUnreachable, "no connection to " + id);
        } else {
            status = chunkserver->CreateChunk(handle, lease.version);
        }

        if (status.ok() || status.code() == ErrorCode::kChunkExists) {
            MarkConfirmed(handle, id);
            continue;
        }

        if (id == lease.primary) {
            return Status(ErrorCode::kChunkUnavailable,
                          "cannot create chunk " + std::to_string(handle) +
                          " on primary " + id + ": " + status.ToString());
        }
        // A missing secondary surfaces as ReplicationFailed from the primary
        std::cerr << "[Client] Cannot create chunk " << handle << " on " << id
                  << ": " << status << std::endl;
    }
    return Status::OK();
}

bool Client::IsConfirmed(ChunkHandle handle, const ChunkserverId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmed_.count({handle, id}) > 0;
}

void Client::MarkConfirmed(ChunkHandle handle, const ChunkserverId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    confirmed_.insert({handle, id});
}

// ============================================================================
// Read path
// ============================================================================

Status Client::Read(const std::string& path, std::string& out_data) {
    std::vector<ChunkHandle> handles;
    Status status = master_->GetFileChunks(path, handles);
    if (!status.ok()) {
        return status;
    }

    std::string result;
    for (ChunkHandle handle : handles) {
        std::string chunk_data;
        status = ReadChunk(handle, chunk_data);
        if (!status.ok()) {
            return status;
        }
        result.append(chunk_data);
    }

    std::cout << "[Client] Read " << result.length() << " bytes from " << path << std::endl;
    out_data = std::move(result);
    return Status::OK();
}

Status Client::ReadChunk(ChunkHandle handle, std::string& out_data) {
    ChunkLocations locations;
    Status status = master_->GetChunkLocations(handle, locations);
    if (!status.ok()) {
        return status;
    }

    // Valid primary first, then the other alive replicas in ascending id order
    std::vector<ChunkserverId> candidates;
    if (locations.primary) {
        candidates.push_back(*locations.primary);
    }
    std::vector<ChunkserverId> alive = locations.alive_replicas;
    std::sort(alive.begin(), alive.end());
    for (const auto& id : alive) {
        if (std::find(candidates.begin(), candidates.end(), id) == candidates.end()) {
            candidates.push_back(id);
        }
    }

    for (const auto& id : candidates) {
        auto chunkserver = chunkservers_->Get(id);
        if (!chunkserver) {
            continue;
        }
        std::string data;
        Status read = chunkserver->ReadChunk(handle, std::nullopt, data);
        if (read.ok()) {
            out_data = std::move(data);
            return Status::OK();
        }
        std::cerr << "[Client] Read of chunk " << handle << " from " << id
                  << " failed, trying next replica: " << read << std::endl;
    }

    return Status(ErrorCode::kChunkUnavailable,
                  "no replica could serve chunk " + std::to_string(handle));
}

}  // namespace gfs_client
