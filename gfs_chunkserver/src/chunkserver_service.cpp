#include "gfs_chunkserver/chunkserver_service.hpp"
#include "gfs_rpc/proto_convert.hpp"

#include <climits>
#include <utility>
#include <grpcpp/health_check_service_interface.h>

namespace gfs_chunkserver {

using gfs_rpc::SetReplyStatus;

ChunkserverServiceImpl::ChunkserverServiceImpl(std::shared_ptr<Chunkserver> chunkserver)
    : chunkserver_(std::move(chunkserver)) {}

grpc::Status ChunkserverServiceImpl::CreateChunk(grpc::ServerContext* context,
                                                 const gfs::CreateChunkRequest* request,
                                                 gfs::CreateChunkResponse* response) {
    Status status = chunkserver_->CreateChunk(request->chunk_handle(), request->version());
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status ChunkserverServiceImpl::ReadChunk(grpc::ServerContext* context,
                                               const gfs::ReadChunkRequest* request,
                                               gfs::ReadChunkResponse* response) {
    std::optional<ByteRange> range;
    if (request->ranged()) {
        range = ByteRange{request->offset(), request->length()};
    }

    std::string data;
    Status status = chunkserver_->ReadChunk(request->chunk_handle(), range, data);
    if (status.ok()) {
        response->set_data(std::move(data));
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status ChunkserverServiceImpl::Append(grpc::ServerContext* context,
                                            const gfs::AppendRequest* request,
                                            gfs::AppendResponse* response) {
    AppendRole role = request->role() == gfs::PRIMARY ? AppendRole::kPrimary
                                                      : AppendRole::kSecondary;
    std::vector<ChunkserverId> secondaries(request->secondaries().begin(),
                                           request->secondaries().end());

    Status status = chunkserver_->Append(request->chunk_handle(), request->data(), role,
                                         secondaries, request->version());
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

grpc::Status ChunkserverServiceImpl::GetChunkInfo(grpc::ServerContext* context,
                                                  const gfs::GetChunkInfoRequest* request,
                                                  gfs::GetChunkInfoResponse* response) {
    ChunkInfo info;
    Status status = chunkserver_->GetChunkInfo(request->chunk_handle(), info);
    if (status.ok()) {
        response->set_size(info.size);
        response->set_version(info.version);
        response->set_checksum(info.checksum);
    }
    SetReplyStatus(status, response->mutable_status());
    return grpc::Status::OK;
}

std::unique_ptr<grpc::Server> StartChunkserverServer(const std::string& address,
                                                     ChunkserverServiceImpl* service,
                                                     uint64_t chunk_size,
                                                     int* selected_port) {
    uint64_t message_limit = chunk_size + 64 * 1024;
    int max_message_size = message_limit > static_cast<uint64_t>(INT_MAX)
                               ? INT_MAX
                               : static_cast<int>(message_limit);

    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), selected_port);
    builder.SetMaxReceiveMessageSize(max_message_size);
    builder.SetMaxSendMessageSize(max_message_size);
    builder.RegisterService(service);
    return builder.BuildAndStart();
}

}  // namespace gfs_chunkserver
