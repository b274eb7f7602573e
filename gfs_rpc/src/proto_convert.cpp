#include "gfs_rpc/proto_convert.hpp"

namespace gfs_rpc {

using gfs_common::ErrorCode;

gfs::ErrorCode ToProto(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:                   return gfs::OK;
        case ErrorCode::kAlreadyExists:        return gfs::ALREADY_EXISTS;
        case ErrorCode::kUnknownFile:          return gfs::UNKNOWN_FILE;
        case ErrorCode::kUnknownChunk:         return gfs::UNKNOWN_CHUNK;
        case ErrorCode::kInsufficientReplicas: return gfs::INSUFFICIENT_REPLICAS;
        case ErrorCode::kChunkUnavailable:     return gfs::CHUNK_UNAVAILABLE;
        case ErrorCode::kChunkExists:          return gfs::CHUNK_EXISTS;
        case ErrorCode::kChunkNotFound:        return gfs::CHUNK_NOT_FOUND;
        case ErrorCode::kChunkFull:            return gfs::CHUNK_FULL;
        case ErrorCode::kReplicationFailed:    return gfs::REPLICATION_FAILED;
        case ErrorCode::kUnreachable:          return gfs::UNREACHABLE;
        case ErrorCode::kInvalidArgument:      return gfs::INVALID_ARGUMENT;
    }
    return gfs::INVALID_ARGUMENT;
}

ErrorCode FromProto(gfs::ErrorCode code) {
    switch (code) {
        case gfs::OK:                    return ErrorCode::kOk;
        case gfs::ALREADY_EXISTS:        return ErrorCode::kAlreadyExists;
        case gfs::UNKNOWN_FILE:          return ErrorCode::kUnknownFile;
        case gfs::UNKNOWN_CHUNK:         return ErrorCode::kUnknownChunk;
        case gfs::INSUFFICIENT_REPLICAS: return ErrorCode::kInsufficientReplicas;
        case gfs::CHUNK_UNAVAILABLE:     return ErrorCode::kChunkUnavailable;
        case gfs::CHUNK_EXISTS:          return ErrorCode::kChunkExists;
        case gfs::CHUNK_NOT_FOUND:       return ErrorCode::kChunkNotFound;
        case gfs::CHUNK_FULL:            return ErrorCode::kChunkFull;
        case gfs::REPLICATION_FAILED:    return ErrorCode::kReplicationFailed;
        case gfs::UNREACHABLE:           return ErrorCode::kUnreachable;
        case gfs::INVALID_ARGUMENT:      return ErrorCode::kInvalidArgument;
        default:                         break;
    }
    // Codes added by a newer peer
    return ErrorCode::kInvalidArgument;
}

void SetReplyStatus(const gfs_common::Status& status, gfs::ReplyStatus* reply) {
    reply->set_code(ToProto(status.code()));
    reply->set_message(status.message());
}

gfs_common::Status FromCall(const grpc::Status& transport, const gfs::ReplyStatus& reply,
                            const std::string& peer) {
    if (!transport.ok()) {
        return gfs_common::Status(ErrorCode::kUnreachable,
                                  peer + ": " + transport.error_message());
    }
    return gfs_common::Status(FromProto(reply.code()), reply.message());
}

}  // namespace gfs_rpc
