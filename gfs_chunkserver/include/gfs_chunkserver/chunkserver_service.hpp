#pragma once

#include "gfs_chunkserver/chunkserver.hpp"
#include "gfs_service/gfs.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <string>

namespace gfs_chunkserver {

/**
 * ChunkserverServiceImpl: gRPC front of a Chunkserver.
 *
 * - CreateChunk:  allocate an empty chunk
 * - ReadChunk:    whole chunk, or a range when request.ranged is set
 * - Append:       primary (with fan-out) or secondary append
 * - GetChunkInfo: size, version, SHA-256 checksum
 *
 * Usage:
 *   auto impl = std::make_unique<ChunkserverServiceImpl>(chunkserver);
 *   grpc::ServerBuilder builder;
 *   builder.AddListeningPort("0.0.0.0:50051", grpc::InsecureServerCredentials());
 *   builder.RegisterService(impl.get());
 *   auto server = builder.BuildAndStart();
 */
class ChunkserverServiceImpl final : public gfs::ChunkserverService::Service {
public:
    explicit ChunkserverServiceImpl(std::shared_ptr<Chunkserver> chunkserver);

    grpc::Status CreateChunk(grpc::ServerContext* context,
                             const gfs::CreateChunkRequest* request,
                             gfs::CreateChunkResponse* response) override;

    grpc::Status ReadChunk(grpc::ServerContext* context,
                           const gfs::ReadChunkRequest* request,
                           gfs::ReadChunkResponse* response) override;

    grpc::Status Append(grpc::ServerContext* context,
                        const gfs::AppendRequest* request,
                        gfs::AppendResponse* response) override;

    grpc::Status GetChunkInfo(grpc::ServerContext* context,
                              const gfs::GetChunkInfoRequest* request,
                              gfs::GetChunkInfoResponse* response) override;

private:
    std::shared_ptr<Chunkserver> chunkserver_;
};

// Starts a server for `service` on `address` with the default health-check
// service enabled and message limits sized for one chunk plus framing.
// `selected_port` may be null. Returns null if the server failed to start.
std::unique_ptr<grpc::Server> StartChunkserverServer(const std::string& address,
                                                     ChunkserverServiceImpl* service,
                                                     uint64_t chunk_size,
                                                     int* selected_port = nullptr);

}  // namespace gfs_chunkserver
