#pragma once

#include "gfs_common/chunkserver_api.hpp"
#include "gfs_common/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace gfs_common {

/**
 * ChunkserverPool: chunkserver id -> connection.
 *
 * Shared by clients (data path) and primaries (fan-out to secondaries).
 * Connections are either registered up front or created on first use by the
 * factory, e.g. a gRPC stub dialing the id as "host:port".
 *
 * Thread-safe.
 *
 * Usage:
 *   auto pool = std::make_shared<ChunkserverPool>();
 *   pool->SetFactory([](const ChunkserverId& id) { return MakeStub(id); });
 *   auto cs = pool->Get("10.0.0.5:50051");
 */
class ChunkserverPool {
public:
    using Factory = std::function<std::shared_ptr<ChunkserverApi>(const ChunkserverId&)>;

    ChunkserverPool() = default;

    void Register(const ChunkserverId& id, std::shared_ptr<ChunkserverApi> chunkserver);
    bool Unregister(const ChunkserverId& id);
    void SetFactory(Factory factory);

    // nullptr if the id is unknown and no factory can reach it
    std::shared_ptr<ChunkserverApi> Get(const ChunkserverId& id);

    std::vector<ChunkserverId> Ids() const;
    size_t Size() const;

    // Drops every connection (breaks reference cycles on shutdown)
    void Clear();

private:
    mutable std::mutex mutex_;
    std::map<ChunkserverId, std::shared_ptr<ChunkserverApi>> chunkservers_;
    Factory factory_;
};

}  // namespace gfs_common
