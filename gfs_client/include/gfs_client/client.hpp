#pragma once

#include "gfs_common/chunkserver_pool.hpp"
#include "gfs_common/config.hpp"
#include "gfs_common/master_api.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gfs_client {

using gfs_common::ChunkHandle;
using gfs_common::ChunkserverId;
using gfs_common::Status;

/**
 * Client: drives the multi-step file protocols.
 *
 * Write path (Append):
 *   master GetFileChunks / AllocateChunk -> master GetOrGrantLease
 *   -> CreateChunk on every replica not yet confirmed
 *   -> Append on the primary, which forwards to the secondaries
 *   A ChunkFull from the primary is retried once on a freshly allocated chunk.
 *
 * Read path (Read):
 *   master GetFileChunks -> per chunk GetChunkLocations
 *   -> ReadChunk from the valid primary, then the other alive replicas in
 *      ascending id order, until one answers.
 *
 * The client holds no authoritative state. It remembers which replicas are
 * known to hold a chunk only to skip redundant CreateChunk calls.
 *
 * Thread-safe.
 */
class Client {
public:
    using ReplicationFailureObserver = std::function<void(
        const std::string& path, ChunkHandle handle, const Status& status)>;

    Client(std::shared_ptr<gfs_common::MasterApi> master,
           std::shared_ptr<gfs_common::ChunkserverPool> chunkservers,
           const gfs_common::GfsConfig& config);

    // Master errors pass through unchanged
    Status Create(const std::string& path);

    /**
     * Record-append data to the end of path.
     *
     * @return ChunkFull if data is larger than a chunk or the retry chunk is
     *         full too; ReplicationFailed (after notifying the observer) and
     *         ChunkUnavailable unchanged; master errors unchanged
     */
    Status Append(const std::string& path, const std::string& data);

    /**
     * Read the whole file, chunks concatenated in file order.
     *
     * @param out_data [OUTPUT] filled on success
     * @return UnknownFile, or ChunkUnavailable if no replica of some chunk
     *         could serve it
     */
    Status Read(const std::string& path, std::string& out_data);

    // Called on every ReplicationFailed; no retry happens here
    void SetReplicationFailureObserver(ReplicationFailureObserver observer);

private:
    // One attempt against one chunk, no reallocation
    Status AppendToChunk(ChunkHandle handle, const std::string& data);

    // CreateChunk on replicas not confirmed yet; ChunkExists counts as success
    Status EnsureReplicasCreated(ChunkHandle handle, const gfs_common::LeaseGrant& lease);

    Status ReadChunk(ChunkHandle handle, std::string& out_data);

    bool IsConfirmed(ChunkHandle handle, const ChunkserverId& id);
    void MarkConfirmed(ChunkHandle handle, const ChunkserverId& id);

    std::shared_ptr<gfs_common::MasterApi> master_;
    std::shared_ptr<gfs_common::ChunkserverPool> chunkservers_;
    gfs_common::GfsConfig config_;

    std::mutex mutex_;  // guards confirmed_ and replication_observer_
    std::set<std::pair<ChunkHandle, ChunkserverId>> confirmed_;
    ReplicationFailureObserver replication_observer_;
};

}  // namespace gfs_client
