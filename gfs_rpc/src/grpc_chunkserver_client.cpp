#include "gfs_rpc/grpc_chunkserver_client.hpp"
#include "gfs_rpc/proto_convert.hpp"

#include <climits>

namespace gfs_rpc {

using gfs_common::AppendRole;
using gfs_common::ByteRange;
using gfs_common::ChunkHandle;
using gfs_common::ChunkInfo;
using gfs_common::ChunkserverId;
using gfs_common::ChunkVersion;
using gfs_common::Status;

namespace {

// Headroom for the request fields around the payload
constexpr uint64_t MESSAGE_OVERHEAD = 64 * 1024;

}  // namespace

std::shared_ptr<grpc::Channel> GrpcChunkserverClient::CreateDataChannel(
    const std::string& target, uint64_t max_message_size) {
    uint64_t limit = max_message_size + MESSAGE_OVERHEAD;
    int size = limit > static_cast<uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(limit);

    grpc::ChannelArguments arguments;
    arguments.SetMaxReceiveMessageSize(size);
    arguments.SetMaxSendMessageSize(size);
    return grpc::CreateCustomChannel(target, grpc::InsecureChannelCredentials(), arguments);
}

GrpcChunkserverClient::GrpcChunkserverClient(const std::string& target,
                                             uint64_t max_message_size,
                                             std::chrono::milliseconds deadline)
    : GrpcChunkserverClient(CreateDataChannel(target, max_message_size), target, deadline) {}

GrpcChunkserverClient::GrpcChunkserverClient(std::shared_ptr<grpc::Channel> channel,
                                             const std::string& target,
                                             std::chrono::milliseconds deadline)
    : target_(target),
      deadline_(deadline),
      stub_(gfs::ChunkserverService::NewStub(channel)) {}

void GrpcChunkserverClient::PrepareContext(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
}

Status GrpcChunkserverClient::CreateChunk(ChunkHandle handle, ChunkVersion version) {
    gfs::CreateChunkRequest request;
    request.set_chunk_handle(handle);
    request.set_version(version);

    gfs::CreateChunkResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->CreateChunk(&context, request, &response);
    return FromCall(status, response.status(), target_);
}

Status GrpcChunkserverClient::ReadChunk(ChunkHandle handle,
                                        const std::optional<ByteRange>& range,
                                        std::string& out_data) {
    gfs::ReadChunkRequest request;
    request.set_chunk_handle(handle);
    if (range) {
        request.set_ranged(true);
        request.set_offset(range->offset);
        request.set_length(range->length);
    }

    gfs::ReadChunkResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->ReadChunk(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out_data = response.data();
    }
    return result;
}

Status GrpcChunkserverClient::Append(ChunkHandle handle, const std::string& data,
                                     AppendRole role,
                                     const std::vector<ChunkserverId>& secondaries,
                                     ChunkVersion version) {
    gfs::AppendRequest request;
    request.set_chunk_handle(handle);
    request.set_data(data);
    request.set_role(role == AppendRole::kPrimary ? gfs::PRIMARY : gfs::SECONDARY);
    for (const auto& secondary : secondaries) {
        request.add_secondaries(secondary);
    }
    request.set_version(version);

    gfs::AppendResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->Append(&context, request, &response);
    return FromCall(status, response.status(), target_);
}

Status GrpcChunkserverClient::GetChunkInfo(ChunkHandle handle, ChunkInfo& out_info) {
    gfs::GetChunkInfoRequest request;
    request.set_chunk_handle(handle);

    gfs::GetChunkInfoResponse response;
    grpc::ClientContext context;
    PrepareContext(context);

    auto status = stub_->GetChunkInfo(&context, request, &response);
    Status result = FromCall(status, response.status(), target_);
    if (result.ok()) {
        out_info.size = response.size();
        out_info.version = response.version();
        out_info.checksum = response.checksum();
    }
    return result;
}

}  // namespace gfs_rpc
