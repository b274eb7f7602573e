#pragma once

#include "gfs_common/status.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace gfs_common {

// ============================================================================
// Defaults
// ============================================================================
constexpr uint64_t DEFAULT_CHUNK_SIZE = 64ull * 1024 * 1024;  // 64 MiB
constexpr int DEFAULT_REPLICATION_FACTOR = 3;
constexpr int DEFAULT_LEASE_TIMEOUT_S = 60;
constexpr int DEFAULT_HEARTBEAT_INTERVAL_S = 10;
constexpr int DEFAULT_DEAD_THRESHOLD_S = 30;

/**
 * GfsConfig: cluster-wide tunables shared by master, chunkservers and clients.
 *
 * Durations are held in milliseconds so tests can run with short intervals;
 * command-line flags take whole seconds.
 */
struct GfsConfig {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    int replication_factor = DEFAULT_REPLICATION_FACTOR;
    std::chrono::milliseconds lease_timeout = std::chrono::seconds(DEFAULT_LEASE_TIMEOUT_S);
    std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(DEFAULT_HEARTBEAT_INTERVAL_S);
    std::chrono::milliseconds dead_threshold = std::chrono::seconds(DEFAULT_DEAD_THRESHOLD_S);
};

/**
 * Check that every tunable is usable.
 * The dead threshold may be shorter than the heartbeat interval.
 */
Status ValidateConfig(const GfsConfig& config);

/**
 * Apply one of the shared command-line flags:
 *   --chunk-size <bytes>
 *   --replication <n>
 *   --lease-timeout <seconds>
 *   --heartbeat-interval <seconds>
 *   --dead-threshold <seconds>
 *
 * @param handled [OUTPUT] false if flag is not one of the shared flags
 * @return kInvalidArgument if the value does not parse or is out of range
 */
Status ApplyConfigFlag(GfsConfig& config, const std::string& flag,
                       const std::string& value, bool& handled);

// Multi-line summary for startup banners
std::string DescribeConfig(const GfsConfig& config);

}  // namespace gfs_common
