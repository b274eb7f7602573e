#pragma once

#include "gfs_chunkserver/chunk_store.hpp"
#include "gfs_common/chunkserver_api.hpp"
#include "gfs_common/chunkserver_pool.hpp"
#include "gfs_common/clock.hpp"
#include "gfs_common/config.hpp"
#include "gfs_common/master_api.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gfs_chunkserver {

using gfs_common::AppendRole;
using gfs_common::ByteRange;
using gfs_common::ChunkserverId;

/**
 * Chunkserver: storage node
 *
 * Serves create/read/append for the chunks it holds and, when acting as
 * primary for an append, forwards the same bytes to the secondaries the
 * client named. Reports its inventory to the master on a fixed interval.
 *
 * Fan-out is synchronous and reported all-or-nothing: if any secondary fails,
 * Append returns ReplicationFailed even though the primary (and any
 * secondaries that did succeed) already hold the new bytes.
 *
 * Heartbeat delivery failures are logged and dropped; the next tick retries.
 *
 * Thread-safe: delegates to the thread-safe ChunkStore.
 *
 * Usage:
 *   auto cs = std::make_shared<Chunkserver>("cs1", config, master, pool, clock);
 *   pool->Register("cs1", cs);
 *   cs->Start();   // heartbeat thread
 *   ...
 *   cs->Stop();
 */
class Chunkserver final : public gfs_common::ChunkserverApi {
public:
    /**
     * @param chunkserver_id identity reported to the master
     * @param master         heartbeat target
     * @param peers          how a primary reaches its secondaries
     * @param clock          heartbeat timestamps
     */
    Chunkserver(const ChunkserverId& chunkserver_id,
                const gfs_common::GfsConfig& config,
                std::shared_ptr<gfs_common::MasterApi> master,
                std::shared_ptr<gfs_common::ChunkserverPool> peers,
                std::shared_ptr<gfs_common::Clock> clock);
    ~Chunkserver() override;

    Status CreateChunk(ChunkHandle handle, ChunkVersion version) override;
    Status ReadChunk(ChunkHandle handle, const std::optional<ByteRange>& range,
                     std::string& out_data) override;
    Status Append(ChunkHandle handle, const std::string& data, AppendRole role,
                  const std::vector<ChunkserverId>& secondaries,
                  ChunkVersion version) override;
    Status GetChunkInfo(ChunkHandle handle, ChunkInfo& out_info) override;

    /**
     * Report {id, stored handles, now} to the master once.
     * Never fails towards the caller.
     */
    void HeartbeatTick();

    // Start/stop the background heartbeat thread (first tick is immediate)
    void Start();
    void Stop();

    const ChunkserverId& id() const { return chunkserver_id_; }
    uint64_t heartbeat_failures() const { return heartbeat_failures_.load(); }

    std::string GetStatistics();

private:
    void HeartbeatLoop();

    ChunkserverId chunkserver_id_;
    gfs_common::GfsConfig config_;
    std::shared_ptr<gfs_common::MasterApi> master_;
    std::shared_ptr<gfs_common::ChunkserverPool> peers_;
    std::shared_ptr<gfs_common::Clock> clock_;
    std::unique_ptr<ChunkStore> chunk_store_;

    std::thread heartbeat_thread_;
    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_ = false;

    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> heartbeat_failures_{0};
};

}  // namespace gfs_chunkserver
