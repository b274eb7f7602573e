#include "gfs_common/config.hpp"

#include <climits>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace gfs_common {

namespace {

Status ParseUnsigned(const std::string& flag, const std::string& value,
                     uint64_t& out) {
    try {
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.find('-') != std::string::npos) {
            return Status(ErrorCode::kInvalidArgument,
                          flag + " expects a non-negative integer, got '" + value + "'");
        }
        out = parsed;
        return Status::OK();
    } catch (const std::exception&) {
        return Status(ErrorCode::kInvalidArgument,
                      flag + " expects a non-negative integer, got '" + value + "'");
    }
}

Status ParseBounded(const std::string& flag, const std::string& value,
                    uint64_t max, uint64_t& out) {
    Status status = ParseUnsigned(flag, value, out);
    if (status.ok() && out > max) {
        return Status(ErrorCode::kInvalidArgument,
                      flag + " must be at most " + std::to_string(max) + ", got '" + value + "'");
    }
    return status;
}

// Durations are stored in milliseconds
constexpr uint64_t kMaxSeconds = static_cast<uint64_t>(INT64_MAX) / 1000;

}  // namespace

Status ValidateConfig(const GfsConfig& config) {
    if (config.chunk_size == 0) {
        return Status(ErrorCode::kInvalidArgument, "chunk size must be positive");
    }
    if (config.replication_factor < 1) {
        return Status(ErrorCode::kInvalidArgument, "replication factor must be at least 1");
    }
    if (config.lease_timeout.count() <= 0) {
        return Status(ErrorCode::kInvalidArgument, "lease timeout must be positive");
    }
    if (config.heartbeat_interval.count() <= 0) {
        return Status(ErrorCode::kInvalidArgument, "heartbeat interval must be positive");
    }
    if (config.dead_threshold.count() <= 0) {
        return Status(ErrorCode::kInvalidArgument, "dead threshold must be positive");
    }
    return Status::OK();
}

Status ApplyConfigFlag(GfsConfig& config, const std::string& flag,
                       const std::string& value, bool& handled) {
    handled = true;
    uint64_t parsed = 0;

    if (flag == "--chunk-size") {
        Status status = ParseUnsigned(flag, value, parsed);
        if (status.ok()) config.chunk_size = parsed;
        return status;
    }
    if (flag == "--replication") {
        Status status = ParseBounded(flag, value, INT_MAX, parsed);
        if (status.ok()) config.replication_factor = static_cast<int>(parsed);
        return status;
    }
    if (flag == "--lease-timeout") {
        Status status = ParseBounded(flag, value, kMaxSeconds, parsed);
        if (status.ok()) config.lease_timeout = std::chrono::seconds(parsed);
        return status;
    }
    if (flag == "--heartbeat-interval") {
        Status status = ParseBounded(flag, value, kMaxSeconds, parsed);
        if (status.ok()) config.heartbeat_interval = std::chrono::seconds(parsed);
        return status;
    }
    if (flag == "--dead-threshold") {
        Status status = ParseBounded(flag, value, kMaxSeconds, parsed);
        if (status.ok()) config.dead_threshold = std::chrono::seconds(parsed);
        return status;
    }

    handled = false;
    return Status::OK();
}

std::string DescribeConfig(const GfsConfig& config) {
    std::stringstream ss;
    ss << "Chunk Size: " << config.chunk_size << " bytes" << std::endl
       << "Replication Factor: " << config.replication_factor << std::endl
       << "Lease Timeout: " << config.lease_timeout.count() << " ms" << std::endl
       << "Heartbeat Interval: " << config.heartbeat_interval.count() << " ms" << std::endl
       << "Dead Threshold: " << config.dead_threshold.count() << " ms" << std::endl;
    return ss.str();
}

}  // namespace gfs_common
