#pragma once

#include "gfs_common/master_api.hpp"
#include "gfs_service/gfs.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <memory>
#include <string>

namespace gfs_rpc {

using gfs_common::ChunkAllocation;
using gfs_common::ChunkHandle;
using gfs_common::ChunkLocations;
using gfs_common::ChunkserverId;
using gfs_common::LeaseGrant;
using gfs_common::Status;
using gfs_common::Timestamp;

/**
 * GrpcMasterClient: MasterApi over a gRPC channel to gfs_master.
 *
 * Every call carries a deadline; a call that misses it, or cannot reach the
 * master at all, returns kUnreachable.
 *
 * Usage:
 *   auto master = std::make_shared<GrpcMasterClient>("master:50050");
 *   master->CreateFile("/logs/a");
 */
class GrpcMasterClient final : public gfs_common::MasterApi {
public:
    explicit GrpcMasterClient(const std::string& target,
                              std::chrono::milliseconds deadline = std::chrono::seconds(5));
    GrpcMasterClient(std::shared_ptr<grpc::Channel> channel, const std::string& target,
                     std::chrono::milliseconds deadline = std::chrono::seconds(5));

    Status CreateFile(const std::string& path) override;
    Status AllocateChunk(const std::string& path, ChunkAllocation& out) override;
    Status GetOrGrantLease(ChunkHandle handle, LeaseGrant& out) override;
    Status GetChunkLocations(ChunkHandle handle, ChunkLocations& out) override;
    Status GetFileChunks(const std::string& path, std::vector<ChunkHandle>& out) override;
    Status RevokeLease(ChunkHandle handle) override;
    Status Heartbeat(const ChunkserverId& chunkserver_id,
                     const std::vector<ChunkHandle>& chunk_handles,
                     Timestamp timestamp) override;

private:
    void PrepareContext(grpc::ClientContext& context) const;

    std::string target_;
    std::chrono::milliseconds deadline_;
    std::unique_ptr<gfs::MasterService::Stub> stub_;
};

}  // namespace gfs_rpc
