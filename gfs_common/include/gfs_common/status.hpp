#pragma once

#include <ostream>
#include <string>

namespace gfs_common {

enum class ErrorCode {
    kOk = 0,
    kAlreadyExists,
    kUnknownFile,
    kUnknownChunk,
    kInsufficientReplicas,
    kChunkUnavailable,
    kChunkExists,
    kChunkNotFound,
    kChunkFull,
    kReplicationFailed,
    kUnreachable,       // the remote side of a call could not be reached
    kInvalidArgument
};

const char* ErrorCodeName(ErrorCode code);

/**
 * Status: typed outcome of every master, chunkserver and client operation.
 *
 * Modelled after grpc::Status so results read the same on both sides of the
 * wire. Operations that produce a value return a Status and fill an output
 * parameter only when ok() is true.
 */
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message);

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::kOk; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // "ChunkFull: chunk 7 has 12 bytes left"
    std::string ToString() const;

private:
    ErrorCode code_ = ErrorCode::kOk;
    std::string message_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace gfs_common
