#include "gfs_master/metadata.hpp"

#include <utility>

namespace gfs_master {

FileMetadata::FileMetadata(const std::string& path) : path(path) {}

ChunkMetadata::ChunkMetadata(ChunkHandle handle, std::vector<ChunkserverId> replicas)
    : handle(handle), version(0), replicas(std::move(replicas)) {}

bool ChunkMetadata::HasValidLease(Timestamp now) const {
    return primary.has_value() && lease_expiry.has_value() && now < *lease_expiry;
}

void ChunkMetadata::ClearLease() {
    primary.reset();
    lease_expiry.reset();
}

}  // namespace gfs_master
