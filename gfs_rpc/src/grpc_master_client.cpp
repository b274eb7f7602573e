#include "gfs_rpc/grpc_master_client.hpp"
#include "gfs_rpc/proto_convert.hpp"

namespace gfs_rpc {

GrpcMasterClient::GrpcMasterClient(const std::string& target,
                                   std::chrono::milliseconds deadline)
    : GrpcMasterClient(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()),
                       target, deadline) {}

GrpcMasterClient::GrpcMasterClient(std::shared_ptr<grpc::Channel> channel,
                                   const std::string& target,
                                   std::chrono::milliseconds deadline)
    : target_(target),
      deadline_(deadline),
      stub_(gfs::MasterService::NewStub(channel)) {}

void GrpcMasterClient::PrepareContext(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
}

Status GrpcMasterClient::CreateFile(const std::string& path) {
    gfs::CreateFileRequest request;
    request.set_path(path);

    gfs::CreateFileResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->CreateFile(&context, request, &response);
    return FromCall(status, response.status(), target_);
}

Status GrpcMasterClient::AllocateChunk(const std::string& path, ChunkAllocation& out) {
    gfs::AllocateChunkRequest request;
    request.set_path(path);

    gfs::AllocateChunkResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->AllocateChunk(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out.handle = response.chunk_handle();
        out.replicas.assign(response.replicas().begin(), response.replicas().end());
    }
    return result;
}

Status GrpcMasterClient::GetOrGrantLease(ChunkHandle handle, LeaseGrant& out) {
    gfs::GetOrGrantLeaseRequest request;
    request.set_chunk_handle(handle);

    gfs::GetOrGrantLeaseResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->GetOrGrantLease(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out.primary = response.primary();
        out.secondaries.assign(response.secondaries().begin(), response.secondaries().end());
        out.version = response.version();
        out.expiry = Timestamp(response.expiry_ms());
    }
    return result;
}

Status GrpcMasterClient::GetChunkLocations(ChunkHandle handle, ChunkLocations& out) {
    gfs::GetChunkLocationsRequest request;
    request.set_chunk_handle(handle);

    gfs::GetChunkLocationsResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->GetChunkLocations(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out.replicas.assign(response.replicas().begin(), response.replicas().end());
        out.alive_replicas.assign(response.alive_replicas().begin(),
                                  response.alive_replicas().end());
        if (response.primary_valid()) {
            out.primary = response.primary();
        } else {
            out.primary.reset();
        }
    }
    return result;
}

Status GrpcMasterClient::GetFileChunks(const std::string& path,
                                       std::vector<ChunkHandle>& out) {
    gfs::GetFileChunksRequest request;
    request.set_path(path);

    gfs::GetFileChunksResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->GetFileChunks(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out.assign(response.chunk_handles().begin(), response.chunk_handles().end());
    }
    return result;
}

Status GrpcMasterClient::RevokeLease(ChunkHandle handle) {
    gfs::RevokeLeaseRequest request;
    request.set_chunk_handle(handle);

    gfs::RevokeLeaseResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->RevokeLease(&context, request, &response);
    return FromCall(status, response.status(), target_);
}

Status GrpcMasterClient::Heartbeat(const ChunkserverId& chunkserver_id,
                                   const std::vector<ChunkHandle>& chunk_handles,
                                   Timestamp timestamp) {
    gfs::HeartbeatRequest request;
    request.set_chunkserver_id(chunkserver_id);
    for (ChunkHandle handle : chunk_handles) {
        request.add_chunk_handles(handle);
    }
    request.set_timestamp_ms(timestamp.count());

    gfs::HeartbeatResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->Heartbeat(&context, request, &response);
    return FromCall(status, response.status(), target_);
}

}  // namespace gfs_rpc
