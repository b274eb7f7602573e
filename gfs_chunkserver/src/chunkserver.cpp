#include "gfs_chunkserver/chunkserver.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace gfs_chunkserver {

using gfs_common::ErrorCode;

Chunkserver::Chunkserver(const ChunkserverId& chunkserver_id,
                         const gfs_common::GfsConfig& config,
                         std::shared_ptr<gfs_common::MasterApi> master,
                         std::shared_ptr<gfs_common::ChunkserverPool> peers,
                         std::shared_ptr<gfs_common::Clock> clock)
    : chunkserver_id_(chunkserver_id),
      config_(config),
      master_(std::move(master)),
      peers_(std::move(peers)),
      clock_(std::move(clock)),
      chunk_store_(std::make_unique<ChunkStore>(config.chunk_size)) {
    std::cout << "[Chunkserver " << chunkserver_id_ << "] Initialized" << std::endl;
}

Chunkserver::~Chunkserver() {
    Stop();
}

// ============================================================================
// Data path
// ============================================================================

Status Chunkserver::CreateChunk(ChunkHandle handle, ChunkVersion version) {
    request_count_++;
    Status status = chunk_store_->CreateChunk(handle, version);
    if (status.ok()) {
        std::cout << "[Chunkserver " << chunkserver_id_ << "] Created chunk " << handle
                  << " (version " << version << ")" << std::endl;
    }
    return status;
}

Status Chunkserver::ReadChunk(ChunkHandle handle, const std::optional<ByteRange>& range,
                              std::string& out_data) {
    request_count_++;
    uint64_t offset = range ? range->offset : 0;
    uint64_t length = range ? range->length : 0;
    return chunk_store_->ReadChunk(handle, offset, length, out_data);
}

Status Chunkserver::Append(ChunkHandle handle, const std::string& data, AppendRole role,
                           const std::vector<ChunkserverId>& secondaries,
                           ChunkVersion version) {
    request_count_++;

    if (role == AppendRole::kSecondary) {
        return chunk_store_->AppendChunk(handle, data, version);
    }

    // Held until every secondary has answered
    auto write_order = chunk_store_->AcquireWriteOrder(handle);

    Status status = chunk_store_->AppendChunk(handle, data, version);
    if (!status.ok()) {
        return status;
    }

    std::vector<std::string> failures;
    for (const auto& secondary : secondaries) {
        if (secondary == chunkserver_id_) {
            continue;
        }

        Status forwarded;
        auto peer = peers_->Get(secondary);
        if (!peer) {
            forwarded = Status(ErrorCode::kUnreachable, "no connection to " + secondary);
        } else {
            forwarded = peer->Append(handle, data, AppendRole::kSecondary, {}, version);
        }

        if (!forwarded.ok()) {
            std::cerr << "[Chunkserver " << chunkserver_id_ << "] Forward of chunk " << handle
                      << " to " << secondary << " failed: " << forwarded << std::endl;
            failures.push_back(secondary + " (" + forwarded.ToString() + ")");
        }
    }

    if (!failures.empty()) {
        // The local copy has already advanced; the caller decides what to do
        std::string message = "chunk " + std::to_string(handle) + " not replicated to";
        for (const auto& failure : failures) {
            message += " " + failure;
        }
        return Status(ErrorCode::kReplicationFailed, message);
    }

    std::cout << "[Chunkserver " << chunkserver_id_ << "] Appended " << data.length()
              << " bytes to chunk " << handle << " as primary ("
              << secondaries.size() << " secondaries)" << std::endl;
    return Status::OK();
}

Status Chunkserver::GetChunkInfo(ChunkHandle handle, ChunkInfo& out_info) {
    request_count_++;
    return chunk_store_->GetChunkInfo(handle, out_info);
}

// ============================================================================
// Heartbeats
// ============================================================================

void Chunkserver::HeartbeatTick() {
    std::vector<ChunkHandle> handles = chunk_store_->GetAllChunks();
    Status status = master_->Heartbeat(chunkserver_id_, handles, clock_->Now());
    if (!status.ok()) {
        heartbeat_failures_++;
        std::cerr << "[Chunkserver " << chunkserver_id_ << "] Heartbeat failed, retrying next tick: "
                  << status << std::endl;
    }
}

void Chunkserver::Start() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    heartbeat_thread_ = std::thread(&Chunkserver::HeartbeatLoop, this);
    std::cout << "[Chunkserver " << chunkserver_id_ << "] Heartbeats every "
              << config_.heartbeat_interval.count() << " ms" << std::endl;
}

void Chunkserver::Stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        running_ = false;
    }
    run_cv_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }
}

void Chunkserver::HeartbeatLoop() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    while (running_) {
        lock.unlock();
        HeartbeatTick();
        lock.lock();
        run_cv_.wait_for(lock, config_.heartbeat_interval, [this] { return !running_; });
    }
}

std::string Chunkserver::GetStatistics() {
    uint64_t total_storage = chunk_store_->GetTotalStorageUsed();
    auto chunks = chunk_store_->GetAllChunks();

    std::stringstream ss;
    ss << "=== Chunkserver Statistics ===" << std::endl
       << "Chunkserver ID: " << chunkserver_id_ << std::endl
       << "Total Chunks: " << chunks.size() << std::endl
       << "Total Storage Used: " << total_storage << " bytes "
       << "(" << (total_storage / (1024 * 1024)) << " MB)" << std::endl
       << "Total Requests: " << request_count_.load() << std::endl
       << "Failed Heartbeats: " << heartbeat_failures_.load() << std::endl;

    return ss.str();
}

}  // namespace gfs_chunkserver
