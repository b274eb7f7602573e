#include "gfs_master/master_service.hpp"
#include "gfs_rpc/proto_convert.hpp"

#include <utility>

namespace gfs_master {

using gfs_rpc::SetReplyStatus;

MasterServiceImpl::MasterServiceImpl(std::shared_ptr<Master> master)
    : master_(std::move(master)) {}

grpc::Status MasterServiceImpl::CreateFile(grpc::ServerContext* context,
                                           const gfs::CreateFileRequest* request,
                                           gfs::CreateFileResponse* response) {
    Status status = master_->CreateFile(request->path());
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::AllocateChunk(grpc::ServerContext* context,
                                              const gfs::AllocateChunkRequest* request,
                                              gfs::AllocateChunkResponse* response) {
    ChunkAllocation allocation;
    Status status = master_->AllocateChunk(request->path(), allocation);
    if (status.ok()) {
        response->set_chunk_handle(allocation.handle);
        for (const auto& id : allocation.replicas) {
            response->add_replicas(id);
        }
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::GetOrGrantLease(grpc::ServerContext* context,
                                                const gfs::GetOrGrantLeaseRequest* request,
                                                gfs::GetOrGrantLeaseResponse* response) {
    LeaseGrant lease;
    Status status = master_->GetOrGrantLease(request->chunk_handle(), lease);
    if (status.ok()) {
        response->set_primary(lease.primary);
        for (const auto& id : lease.secondaries) {
            response->add_secondaries(id);
        }
        response->set_version(lease.version);
        response->set_expiry_ms(lease.expiry.count());
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::GetChunkLocations(grpc::ServerContext* context,
                                                  const gfs::GetChunkLocationsRequest* request,
                                                  gfs::GetChunkLocationsResponse* response) {
    ChunkLocations locations;
    Status status = master_->GetChunkLocations(request->chunk_handle(), locations);
    if (status.ok()) {
        for (const auto& id : locations.replicas) {
            response->add_replicas(id);
        }
        for (const auto& id : locations.alive_replicas) {
            response->add_alive_replicas(id);
        }
        response->set_primary_valid(locations.primary.has_value());
        if (locations.primary) {
            response->set_primary(*locations.primary);
        }
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::GetFileChunks(grpc::ServerContext* context,
                                              const gfs::GetFileChunksRequest* request,
                                              gfs::GetFileChunksResponse* response) {
    std::vector<ChunkHandle> handles;
    Status status = master_->GetFileChunks(request->path(), handles);
    if (status.ok()) {
        for (ChunkHandle handle : handles) {
            response->add_chunk_handles(handle);
        }
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::RevokeLease(grpc::ServerContext* context,
                                            const gfs::RevokeLeaseRequest* request,
                                            gfs::RevokeLeaseResponse* response) {
    Status status = master_->RevokeLease(request->chunk_handle());
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status MasterServiceImpl::Heartbeat(grpc::ServerContext* context,
                                          const gfs::HeartbeatRequest* request,
                                          gfs::HeartbeatResponse* response) {
    std::vector<ChunkHandle> handles(request->chunk_handles().begin(),
                                     request->chunk_handles().end());
    Status status = master_->Heartbeat(request->chunkserver_id(), handles,
                                       Timestamp(request->timestamp_ms()));
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

}  // namespace gfs_master
