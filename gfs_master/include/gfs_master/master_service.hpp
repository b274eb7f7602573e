#pragma once

#include "gfs_master/master.hpp"
#include "gfs_service/gfs.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>

namespace gfs_master {

/**
 * MasterServiceImpl: gRPC front of a Master.
 *
 * Application errors travel in each response's ReplyStatus; the grpc::Status
 * of a handled call is always OK.
 */
class MasterServiceImpl final : public gfs::MasterService::Service {
public:
    explicit MasterServiceImpl(std::shared_ptr<Master> master);

    grpc::Status CreateFile(grpc::ServerContext*, const gfs::CreateFileRequest*,
                            gfs::CreateFileResponse*) override;
    grpc::Status AllocateChunk(grpc::ServerContext*, const gfs::AllocateChunkRequest*,
                               gfs::AllocateChunkResponse*) override;
    grpc::Status GetOrGrantLease(grpc::ServerContext*, const gfs::GetOrGrantLeaseRequest*,
                                 gfs::GetOrGrantLeaseResponse*) override;
    grpc::Status GetChunkLocations(grpc::ServerContext*, const gfs::GetChunkLocationsRequest*,
                                   gfs::GetChunkLocationsResponse*) override;
    grpc::Status GetFileChunks(grpc::ServerContext*, const gfs::GetFileChunksRequest*,
                               gfs::GetFileChunksResponse*) override;
    grpc::Status RevokeLease(grpc::ServerContext*, const gfs::RevokeLeaseRequest*,
                             gfs::RevokeLeaseResponse*) override;
    grpc::Status Heartbeat(grpc::ServerContext*, const gfs::HeartbeatRequest*,
                           gfs::HeartbeatResponse*) override;

private:
    std::shared_ptr<Master> master_;
};

}  // namespace gfs_master
