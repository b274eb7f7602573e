#include "gfs_master/master.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace gfs_master {

using gfs_common::ErrorCode;

namespace {

std::string JoinIds(const std::vector<ChunkserverId>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

}  // namespace

Master::Master(const gfs_common::GfsConfig& config,
               std::shared_ptr<gfs_common::Clock> clock)
    : config_(config),
      clock_(std::move(clock)),
      selector_(config.replication_factor) {
    std::cout << "[Master] Initialized (replication factor " << config_.replication_factor
              << ", dead threshold " << config_.dead_threshold.count() << " ms)" << std::endl;
}

// ============================================================================
// Namespace
// ============================================================================

Status Master::CreateFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_.AddFile(path)) {
        return Status(ErrorCode::kAlreadyExists, "file " + path + " already exists");
    }
    std::cout << "[Master] Created file: " << path << std::endl;
    return Status::OK();
}

Status Master::GetFileChunks(const std::string& path, std::vector<ChunkHandle>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileMetadata* file = store_.FindFile(path);
    if (file == nullptr) {
        return Status(ErrorCode::kUnknownFile, "no such file: " + path);
    }
    out = file->chunk_handles;
    return Status::OK();
}

// ============================================================================
// Allocation
// ============================================================================

Status Master::AllocateChunk(const std::string& path, ChunkAllocation& out) {
    std::vector<LivenessEvent> events;
    Status status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = AllocateChunkLocked(path, clock_->Now(), out, events);
    }
    NotifyLivenessObservers(events);
    return status;
}

Status Master::AllocateChunkLocked(const std::string& path, Timestamp now,
                                   ChunkAllocation& out,
                                   std::vector<LivenessEvent>& events) {
    if (!store_.FileExists(path)) {
        return Status(ErrorCode::kUnknownFile, "no such file: " + path);
    }

    std::vector<ChunkserverId> alive = RefreshLivenessLocked(now, events);
    std::vector<ChunkserverId> replicas = selector_.SelectForAllocation(alive);
    if (replicas.empty()) {
        std::cerr << "[Master] Cannot allocate chunk for " << path << ": "
                  << alive.size() << " alive chunkservers, need "
                  << config_.replication_factor << std::endl;
        return Status(ErrorCode::kInsufficientReplicas,
                      std::to_string(alive.size()) + " alive chunkservers, need " +
                      std::to_string(config_.replication_factor));
    }

    ChunkHandle handle = store_.AddChunk(path, replicas);

    std::cout << "[Master] Allocated chunk " << handle << " for " << path
              << " on [" << JoinIds(replicas) << "]" << std::endl;

    out.handle = handle;
    out.replicas = std::move(replicas);
    return Status::OK();
}

// ============================================================================
// Leases
// ============================================================================

Status Master::GetOrGrantLease(ChunkHandle handle, LeaseGrant& out) {
    std::vector<LivenessEvent> events;
    Status status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = GetOrGrantLeaseLocked(handle, clock_->Now(), out, events);
    }
    NotifyLivenessObservers(events);
    return status;
}

Status Master::GetOrGrantLeaseLocked(ChunkHandle handle, Timestamp now,
                                     LeaseGrant& out,
                                     std::vector<LivenessEvent>& events) {
    ChunkMetadata* chunk = store_.FindChunk(handle);
    if (chunk == nullptr) {
        return Status(ErrorCode::kUnknownChunk, "no such chunk: " + std::to_string(handle));
    }

    RefreshLivenessLocked(now, events);

    if (!chunk->HasValidLease(now)) {
        chunk->ClearLease();

        auto primary = ReplicaSelector::SelectPrimary(
            chunk->replicas, [this](const ChunkserverId& id) {
                const ChunkserverState* state = store_.FindChunkserver(id);
                return state != nullptr && state->alive;
            });
        if (!primary) {
            std::cerr << "[Master] No alive replica for chunk " << handle << std::endl;
            return Status(ErrorCode::kChunkUnavailable,
                          "no alive replica for chunk " + std::to_string(handle));
        }

        chunk->primary = *primary;
        chunk->lease_expiry = now + config_.lease_timeout;
        chunk->version++;

        std::cout << "[Master] Granted lease on chunk " << handle << " to " << *primary
                  << " (version " << chunk->version << ")" << std::endl;
    }

    out.primary = *chunk->primary;
    out.secondaries.clear();
    for (const auto& id : chunk->replicas) {
        if (id != out.primary) {
            out.secondaries.push_back(id);
        }
    }
    out.version = chunk->version;
    out.expiry = *chunk->lease_expiry;
    return Status::OK();
}

Status Master::RevokeLease(ChunkHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkMetadata* chunk = store_.FindChunk(handle);
    if (chunk == nullptr) {
        return Status(ErrorCode::kUnknownChunk, "no such chunk: " + std::to_string(handle));
    }
    if (chunk->primary) {
        std::cout << "[Master] Revoked lease on chunk " << handle << " from "
                  << *chunk->primary << std::endl;
    }
    chunk->ClearLease();
    return Status::OK();
}

// ============================================================================
// Locations
// ============================================================================

Status Master::GetChunkLocations(ChunkHandle handle, ChunkLocations& out) {
    std::vector<LivenessEvent> events;
    Status status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = GetChunkLocationsLocked(handle, clock_->Now(), out, events);
    }
    NotifyLivenessObservers(events);
    return status;
}

Status Master::GetChunkLocationsLocked(ChunkHandle handle, Timestamp now,
                                       ChunkLocations& out,
                                       std::vector<LivenessEvent>& events) {
    ChunkMetadata* chunk = store_.FindChunk(handle);
    if (chunk == nullptr) {
        return Status(ErrorCode::kUnknownChunk, "no such chunk: " + std::to_string(handle));
    }

    std::vector<ChunkserverId> alive = RefreshLivenessLocked(now, events);

    out.replicas = chunk->replicas;
    out.alive_replicas.clear();
    for (const auto& id : chunk->replicas) {
        if (std::binary_search(alive.begin(), alive.end(), id)) {
            out.alive_replicas.push_back(id);
        }
    }
    if (chunk->HasValidLease(now)) {
        out.primary = chunk->primary;
    } else {
        out.primary.reset();
    }
    return Status::OK();
}

// ============================================================================
// Heartbeats and liveness
// ============================================================================

Status Master::Heartbeat(const ChunkserverId& chunkserver_id,
                         const std::vector<ChunkHandle>& chunk_handles,
                         Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [state, registered] = store_.UpsertChunkserver(chunkserver_id);
    if (registered) {
        std::cout << "[Master] Registered chunkserver: " << chunkserver_id << std::endl;
    }

    // Out-of-order delivery must not move last-seen backwards
    if (timestamp > state->last_heartbeat) {
        state->last_heartbeat = timestamp;
    }
    state->reported_chunks = chunk_handles;

    // Only revive here; an alive->dead flip is left for the sweep to report
    if (!state->alive && IsAliveLocked(*state, clock_->Now())) {
        state->alive = true;
        if (!registered) {
            std::cout << "[Master] Chunkserver " << chunkserver_id << " is alive again" << std::endl;
        }
    }
    return Status::OK();
}

void Master::AddLivenessObserver(LivenessObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<ChunkserverId> Master::CheckLiveness() {
    std::vector<LivenessEvent> events;
    std::vector<ChunkserverId> alive;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive = RefreshLivenessLocked(clock_->Now(), events);
    }
    NotifyLivenessObservers(events);
    return alive;
}

std::vector<ChunkserverId> Master::AliveChunkservers() {
    return CheckLiveness();
}

bool Master::IsAliveLocked(const ChunkserverState& state, Timestamp now) const {
    return now - state.last_heartbeat < config_.dead_threshold;
}

std::vector<ChunkserverId> Master::RefreshLivenessLocked(Timestamp now,
                                                         std::vector<LivenessEvent>& events) {
    std::vector<ChunkserverId> alive;
    std::vector<ChunkserverId> newly_dead;

    // Registry is ordered by id, so alive comes out ascending
    for (auto& [id, state] : store_.chunkservers()) {
        bool alive_now = IsAliveLocked(state, now);
        if (state.alive && !alive_now) {
            newly_dead.push_back(id);
        }
        state.alive = alive_now;
        if (alive_now) {
            alive.push_back(id);
        }
    }

    for (const auto& dead : newly_dead) {
        LivenessEvent event;
        event.chunkserver = dead;
        for (const auto& [handle, chunk] : store_.chunks()) {
            if (std::find(chunk.replicas.begin(), chunk.replicas.end(), dead) ==
                chunk.replicas.end()) {
                continue;
            }
            int alive_replicas = 0;
            for (const auto& id : chunk.replicas) {
                if (std::binary_search(alive.begin(), alive.end(), id)) {
                    alive_replicas++;
                }
            }
            if (alive_replicas < config_.replication_factor) {
                event.under_replicated.push_back(handle);
            }
        }

        std::cerr << "[Master] Chunkserver " << dead << " appears dead ("
                  << event.under_replicated.size() << " chunks under-replicated)" << std::endl;
        events.push_back(std::move(event));
    }

    return alive;
}

void Master::NotifyLivenessObservers(const std::vector<LivenessEvent>& events) {
    if (events.empty()) {
        return;
    }

    std::vector<LivenessObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    // Repair policy lives in the observers; the master only reports
    for (const auto& event : events) {
        for (const auto& observer : observers) {
            observer(event.chunkserver, event.under_replicated);
        }
    }
}

// ============================================================================
// Inspection
// ============================================================================

bool Master::ChunkExists(ChunkHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.ChunkExists(handle);
}

size_t Master::ChunkCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.ChunkCount();
}

size_t Master::FileCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.FileCount();
}

}  // namespace gfs_master
