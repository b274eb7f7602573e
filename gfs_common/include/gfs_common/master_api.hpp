#pragma once

#include "gfs_common/status.hpp"
#include "gfs_common/types.hpp"
#include <string>
#include <vector>

namespace gfs_common {

/**
 * MasterApi: call contract of the metadata master.
 *
 * Implemented by gfs_master::Master (in-process) and by
 * gfs_rpc::GrpcMasterClient (remote). Callers must treat every call as one
 * that can fail with kUnreachable, whatever the transport.
 *
 * Output parameters are only written when the returned Status is ok().
 */
class MasterApi {
public:
    virtual ~MasterApi() = default;

    // AlreadyExists if the path is taken
    virtual Status CreateFile(const std::string& path) = 0;

    // UnknownFile, InsufficientReplicas
    virtual Status AllocateChunk(const std::string& path, ChunkAllocation& out) = 0;

    // UnknownChunk, ChunkUnavailable. Idempotent while the lease is valid.
    virtual Status GetOrGrantLease(ChunkHandle handle, LeaseGrant& out) = 0;

    // UnknownChunk
    virtual Status GetChunkLocations(ChunkHandle handle, ChunkLocations& out) = 0;

    // UnknownFile. Handles in append order.
    virtual Status GetFileChunks(const std::string& path,
                                 std::vector<ChunkHandle>& out) = 0;

    // UnknownChunk. Drops the current lease, if any, before its expiry.
    virtual Status RevokeLease(ChunkHandle handle) = 0;

    virtual Status Heartbeat(const ChunkserverId& chunkserver_id,
                             const std::vector<ChunkHandle>& chunk_handles,
                             Timestamp timestamp) = 0;
};

}  // namespace gfs_common
