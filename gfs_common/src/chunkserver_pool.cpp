#include "gfs_common/chunkserver_pool.hpp"

#include <iostream>
#include <utility>

namespace gfs_common {

void ChunkserverPool::Register(const ChunkserverId& id,
                               std::shared_ptr<ChunkserverApi> chunkserver) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunkservers_[id] = std::move(chunkserver);
}

bool ChunkserverPool::Unregister(const ChunkserverId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunkservers_.erase(id) > 0;
}

void ChunkserverPool::SetFactory(Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factory_ = std::move(factory);
}

std::shared_ptr<ChunkserverApi> ChunkserverPool::Get(const ChunkserverId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunkservers_.find(id);
    if (it != chunkservers_.end()) {
        return it->second;
    }
    if (!factory_) {
        return nullptr;
    }

    auto chunkserver = factory_(id);
    if (chunkserver) {
        std::cout << "[ChunkserverPool] Opened connection to " << id << std::endl;
        chunkservers_[id] = chunkserver;
    }
    return chunkserver;
}

std::vector<ChunkserverId> ChunkserverPool::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkserverId> ids;
    for (const auto& entry : chunkservers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t ChunkserverPool::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunkservers_.size();
}

void ChunkserverPool::Clear() {
    std::map<ChunkserverId, std::shared_ptr<ChunkserverApi>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(chunkservers_);
        factory_ = nullptr;
    }
}

}  // namespace gfs_common
