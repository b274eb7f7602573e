#pragma once

#include "gfs_common/chunkserver_api.hpp"
#include "gfs_service/gfs.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <memory>
#include <string>

namespace gfs_rpc {

/**
 * GrpcChunkserverClient: ChunkserverApi over a gRPC channel to one
 * gfs_chunkserver. Used by clients for the data path and by primaries to
 * reach their secondaries.
 *
 * Appends carry whole records, so the channel allows messages up to the
 * configured chunk size plus framing.
 */
class GrpcChunkserverClient final : public gfs_common::ChunkserverApi {
public:
    GrpcChunkserverClient(const std::string& target, uint64_t max_message_size,
                          std::chrono::milliseconds deadline = std::chrono::seconds(30));
    GrpcChunkserverClient(std::shared_ptr<grpc::Channel> channel, const std::string& target,
                          std::chrono::milliseconds deadline = std::chrono::seconds(30));

    gfs_common::Status CreateChunk(gfs_common::ChunkHandle handle,
                                   gfs_common::ChunkVersion version) override;
    gfs_common::Status ReadChunk(gfs_common::ChunkHandle handle,
                                 const std::optional<gfs_common::ByteRange>& range,
                                 std::string& out_data) override;
    gfs_common::Status Append(gfs_common::ChunkHandle handle, const std::string& data,
                              gfs_common::AppendRole role,
                              const std::vector<gfs_common::ChunkserverId>& secondaries,
                              gfs_common::ChunkVersion version) override;
    gfs_common::Status GetChunkInfo(gfs_common::ChunkHandle handle,
                                    gfs_common::ChunkInfo& out_info) override;

    // Channel sized for records up to max_message_size bytes
    static std::shared_ptr<grpc::Channel> CreateDataChannel(const std::string& target,
                                                            uint64_t max_message_size);

private:
    void PrepareContext(grpc::ClientContext& context) const;

    std::string target_;
    std::chrono::milliseconds deadline_;
    std::unique_ptr<gfs::ChunkserverService::Stub> stub_;
};

}  // namespace gfs_rpc
