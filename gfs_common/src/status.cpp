#include "gfs_common/status.hpp"

#include <utility>

namespace gfs_common {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:                   return "OK";
        case ErrorCode::kAlreadyExists:        return "AlreadyExists";
        case ErrorCode::kUnknownFile:          return "UnknownFile";
        case ErrorCode::kUnknownChunk:         return "UnknownChunk";
        case ErrorCode::kInsufficientReplicas: return "InsufficientReplicas";
        case ErrorCode::kChunkUnavailable:     return "ChunkUnavailable";
        case ErrorCode::kChunkExists:          return "ChunkExists";
        case ErrorCode::kChunkNotFound:        return "ChunkNotFound";
        case ErrorCode::kChunkFull:            return "ChunkFull";
        case ErrorCode::kReplicationFailed:    return "ReplicationFailed";
        case ErrorCode::kUnreachable:          return "Unreachable";
        case ErrorCode::kInvalidArgument:      return "InvalidArgument";
    }
    return "Unknown";
}

Status::Status(ErrorCode code, std::string message)
    : code_(code), message_(std::move(message)) {}

std::string Status::ToString() const {
    if (message_.empty()) {
        return ErrorCodeName(code_);
    }
    return std::string(ErrorCodeName(code_)) + ": " + message_;
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.ToString();
}

}  // namespace gfs_common
