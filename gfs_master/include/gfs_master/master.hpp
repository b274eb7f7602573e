#pragma once

#include "gfs_common/clock.hpp"
#include "gfs_common/config.hpp"
#include "gfs_common/master_api.hpp"
#include "gfs_master/metadata_store.hpp"
#include "gfs_master/replica_selector.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gfs_master {

using gfs_common::ChunkAllocation;
using gfs_common::ChunkLocations;
using gfs_common::LeaseGrant;
using gfs_common::Status;

/**
 * Master: metadata authority of the cluster.
 *
 * Responsibilities:
 * - File namespace (flat paths -> ordered chunk handles)
 * - Chunk handle issue and replica placement
 * - Primary leases (at most one unexpired lease per chunk)
 * - Chunkserver liveness from heartbeats
 *
 * Liveness is evaluated lazily: every operation that needs it recomputes which
 * chunkservers are alive. When a chunkserver is seen to go from alive to dead,
 * the registered liveness observers are told which chunks dropped below the
 * replication factor. Observers run after the master lock is released and may
 * call back into the Master.
 *
 * Thread-safe: one mutex guards the whole MetadataStore. Every operation
 * touches at most one chunk plus the registry, so there is no lock ordering.
 *
 * Usage:
 *   auto clock = std::make_shared<gfs_common::SystemClock>();
 *   Master master(config, clock);
 *   master.AddLivenessObserver([](const ChunkserverId& id, const auto& handles) {...});
 *   master.CreateFile("/logs/a");
 *   ChunkAllocation allocation;
 *   Status status = master.AllocateChunk("/logs/a", allocation);
 */
class Master final : public gfs_common::MasterApi {
public:
    using LivenessObserver = std::function<void(
        const ChunkserverId& dead_chunkserver,
        const std::vector<ChunkHandle>& under_replicated)>;

    Master(const gfs_common::GfsConfig& config, std::shared_ptr<gfs_common::Clock> clock);

    Status CreateFile(const std::string& path) override;
    Status AllocateChunk(const std::string& path, ChunkAllocation& out) override;
    Status GetOrGrantLease(ChunkHandle handle, LeaseGrant& out) override;
    Status GetChunkLocations(ChunkHandle handle, ChunkLocations& out) override;
    Status GetFileChunks(const std::string& path, std::vector<ChunkHandle>& out) override;
    Status RevokeLease(ChunkHandle handle) override;

    // Registers the chunkserver on first contact. Always succeeds.
    Status Heartbeat(const ChunkserverId& chunkserver_id,
                     const std::vector<ChunkHandle>& chunk_handles,
                     Timestamp timestamp) override;

    void AddLivenessObserver(LivenessObserver observer);

    /**
     * Sweep the registry, notify observers of newly dead chunkservers.
     * @return alive chunkserver ids, ascending
     */
    std::vector<ChunkserverId> CheckLiveness();

    // Alive chunkserver ids, ascending (also fires pending notifications)
    std::vector<ChunkserverId> AliveChunkservers();

    bool ChunkExists(ChunkHandle handle);
    size_t ChunkCount();
    size_t FileCount();

    const gfs_common::GfsConfig& config() const { return config_; }

private:
    struct LivenessEvent {
        ChunkserverId chunkserver;
        std::vector<ChunkHandle> under_replicated;
    };

    bool IsAliveLocked(const ChunkserverState& state, Timestamp now) const;

    /**
     * Recompute liveness of every registered chunkserver. Records an event for
     * each alive -> dead transition.
     * @return alive ids, ascending
     */
    std::vector<ChunkserverId> RefreshLivenessLocked(Timestamp now,
                                                     std::vector<LivenessEvent>& events);

    Status AllocateChunkLocked(const std::string& path, Timestamp now,
                               ChunkAllocation& out, std::vector<LivenessEvent>& events);
    Status GetOrGrantLeaseLocked(ChunkHandle handle, Timestamp now,
                                 LeaseGrant& out, std::vector<LivenessEvent>& events);
    Status GetChunkLocationsLocked(ChunkHandle handle, Timestamp now,
                                   ChunkLocations& out, std::vector<LivenessEvent>& events);

    void NotifyLivenessObservers(const std::vector<LivenessEvent>& events);

    gfs_common::GfsConfig config_;
    std::shared_ptr<gfs_common::Clock> clock_;

    std::mutex mutex_;  // guards store_ and selector_
    MetadataStore store_;
    ReplicaSelector selector_;

    std::mutex observers_mutex_;
    std::vector<LivenessObserver> observers_;
};

}  // namespace gfs_master
