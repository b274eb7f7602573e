#pragma once

#include "gfs_common/status.hpp"
#include "gfs_service/gfs.pb.h"
#include <grpcpp/grpcpp.h>
#include <string>

namespace gfs_rpc {

gfs::ErrorCode ToProto(gfs_common::ErrorCode code);
gfs_common::ErrorCode FromProto(gfs::ErrorCode code);

// Status -> reply.status
void SetReplyStatus(const gfs_common::Status& status, gfs::ReplyStatus* reply);

/**
 * Outcome of a unary call as seen by the caller.
 *
 * A non-OK grpc::Status means the peer never produced an answer and becomes
 * kUnreachable; otherwise the application status carried in the reply wins.
 */
gfs_common::Status FromCall(const grpc::Status& transport, const gfs::ReplyStatus& reply,
                            const std::string& peer);

}  // namespace gfs_rpc
