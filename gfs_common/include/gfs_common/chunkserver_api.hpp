#pragma once

#include "gfs_common/status.hpp"
#include "gfs_common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gfs_common {

/**
 * ChunkserverApi: call contract of a storage node.
 *
 * Implemented by gfs_chunkserver::Chunkserver (in-process) and by
 * gfs_rpc::GrpcChunkserverClient (remote).
 */
class ChunkserverApi {
public:
    virtual ~ChunkserverApi() = default;

    // ChunkExists if the handle is already stored here
    virtual Status CreateChunk(ChunkHandle handle, ChunkVersion version) = 0;

    /**
     * ChunkNotFound if the handle is not stored here.
     * Without a range the whole chunk is returned.
     */
    virtual Status ReadChunk(ChunkHandle handle, const std::optional<ByteRange>& range,
                             std::string& out_data) = 0;

    /**
     * Record append.
     *
     * As primary: appends locally, then forwards the same bytes as secondary
     * to each of secondaries. A failed forward yields ReplicationFailed even
     * though the local copy has already grown.
     * As secondary: appends locally only; secondaries is ignored.
     *
     * ChunkFull if the bytes do not fit, nothing is written in that case.
     */
    virtual Status Append(ChunkHandle handle, const std::string& data, AppendRole role,
                          const std::vector<ChunkserverId>& secondaries,
                          ChunkVersion version) = 0;

    // ChunkNotFound
    virtual Status GetChunkInfo(ChunkHandle handle, ChunkInfo& out) = 0;
};

}  // namespace gfs_common
