#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "gfs_common/clock.hpp"
#include "gfs_master/master.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;

std::mutex result_mutex;
std::set<uint64_t> allocated_handles;
std::set<std::string> granted_primaries;
std::set<uint64_t> granted_versions;
std::atomic<int> failures{0};

void allocate_chunks(gfs_master::Master* master, const std::string& path, int count) {
    std::vector<uint64_t> mine;
    for (int i = 0; i < count; ++i) {
        gfs_master::ChunkAllocation allocation;
        auto status = master->AllocateChunk(path, allocation);
        if (!status.ok()) {
            std::cerr << "ERROR: AllocateChunk failed: " << status << std::endl;
            failures++;
            continue;
        }
        mine.push_back(allocation.handle);
    }

    // Handles seen by one thread must be strictly increasing
    if (!std::is_sorted(mine.begin(), mine.end()) ||
        std::adjacent_find(mine.begin(), mine.end()) != mine.end()) {
        std::cerr << "ERROR: handles not strictly increasing within a thread" << std::endl;
        failures++;
    }

    std::lock_guard<std::mutex> lock(result_mutex);
    for (auto handle : mine) {
        if (allocated_handles.count(handle) > 0) {
            std::cerr << "ERROR: Duplicate chunk handle allocated: " << handle << std::endl;
            failures++;
        }
        allocated_handles.insert(handle);
    }
}

void request_lease(gfs_master::Master* master, uint64_t handle) {
    gfs_master::LeaseGrant lease;
    auto status = master->GetOrGrantLease(handle, lease);
    if (!status.ok()) {
        std::cerr << "ERROR: GetOrGrantLease failed: " << status << std::endl;
        failures++;
        return;
    }
    std::lock_guard<std::mutex> lock(result_mutex);
    granted_primaries.insert(lease.primary);
    granted_versions.insert(lease.version);
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Testing Concurrent Allocation" << std::endl;
    std::cout << "========================================\n" << std::endl;

    auto clock = std::make_shared<gfs_common::ManualClock>(1000s);
    auto master = std::make_shared<gfs_master::Master>(gfs_testing::TestConfig(), clock);
    for (const auto& id : {"cs1", "cs2", "cs3", "cs4", "cs5"}) {
        master->Heartbeat(id, {}, clock->Now());
    }
    for (int i = 0; i < 4; ++i) {
        master->CreateFile("/file" + std::to_string(i));
    }

    // Test 1: Concurrent chunk allocation
    std::cout << "Test 1: Concurrent Chunk Allocation" << std::endl;
    std::cout << "  Spawning 10 threads, each allocating 100 chunks..." << std::endl;

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back(allocate_chunks, master.get(), "/file" + std::to_string(i % 4), 100);
    }
    for (auto& t : threads) {
        t.join();
    }

    std::cout << "  Allocated " << allocated_handles.size() << " unique chunk handles" << std::endl;
    if (allocated_handles.size() != 1000 || failures.load() != 0) {
        std::cout << "  FAIL: Expected 1000 unique handles, got "
                  << allocated_handles.size() << std::endl;
        return 1;
    }
    if (*allocated_handles.begin() != 1 || *allocated_handles.rbegin() != 1000) {
        std::cout << "  FAIL: handles should cover exactly 1..1000" << std::endl;
        return 1;
    }
    if (master->ChunkCount() != 1000) {
        std::cout << "  FAIL: master records " << master->ChunkCount() << " chunks" << std::endl;
        return 1;
    }
    std::cout << "  PASS: All 1000 chunk handles are unique" << std::endl;

    // Test 2: Concurrent lease requests on one chunk
    std::cout << "\nTest 2: Concurrent Lease Requests" << std::endl;
    std::cout << "  Spawning 16 threads requesting a lease on chunk 1..." << std::endl;

    threads.clear();
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back(request_lease, master.get(), 1);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (failures.load() != 0 || granted_primaries.size() != 1 || granted_versions.size() != 1) {
        std::cout << "  FAIL: " << granted_primaries.size() << " primaries, "
                  << granted_versions.size() << " versions granted" << std::endl;
        return 1;
    }
    std::cout << "  PASS: Exactly one primary (" << *granted_primaries.begin()
              << ") at version " << *granted_versions.begin() << std::endl;

    std::cout << "\n========================================" << std::endl;
    std::cout << "All concurrent tests PASSED!" << std::endl;
    std::cout << "========================================" << std::endl;
    return 0;
}
