#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "gfs_common/clock.hpp"
#include "gfs_master/master.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using gfs_common::ErrorCode;
using gfs_master::ChunkAllocation;
using gfs_master::ChunkHandle;
using gfs_master::ChunkLocations;
using gfs_master::ChunkserverId;
using gfs_master::LeaseGrant;
using gfs_master::Master;
using gfs_master::Status;

struct Fixture {
    std::shared_ptr<gfs_common::ManualClock> clock =
        std::make_shared<gfs_common::ManualClock>(1000s);
    std::shared_ptr<Master> master;

    explicit Fixture(const std::vector<ChunkserverId>& ids, int replication = 3) {
        master = std::make_shared<Master>(gfs_testing::TestConfig(1024, replication), clock);
        Beat(ids);
    }

    void Beat(const std::vector<ChunkserverId>& ids) {
        for (const auto& id : ids) {
            master->Heartbeat(id, {}, clock->Now());
        }
    }
};

// ============================================================================
// Test 1: Namespace
// ============================================================================
void test_create_file() {
    std::cout << "\n=== Test 1: Create file ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3"});

    assert(f.master->CreateFile("/a").ok());
    assert(f.master->CreateFile("/a").code() == ErrorCode::kAlreadyExists);
    assert(f.master->FileCount() == 1);

    std::vector<ChunkHandle> handles;
    assert(f.master->GetFileChunks("/a", handles).ok());
    assert(handles.empty());
    assert(f.master->GetFileChunks("/nope", handles).code() == ErrorCode::kUnknownFile);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 2: Allocation
// ============================================================================
void test_allocate_chunk() {
    std::cout << "\n=== Test 2: Allocate chunk ===" << std::endl;
    Fixture f({"cs3", "cs1", "cs2"});
    f.master->CreateFile("/a");

    ChunkAllocation first;
    assert(f.master->AllocateChunk("/a", first).ok());
    assert(first.handle == 1);
    assert((first.replicas == std::vector<ChunkserverId>{"cs1", "cs2", "cs3"}));

    ChunkAllocation second;
    assert(f.master->AllocateChunk("/a", second).ok());
    assert(second.handle == 2);

    std::vector<ChunkHandle> handles;
    f.master->GetFileChunks("/a", handles);
    assert((handles == std::vector<ChunkHandle>{1, 2}));

    ChunkAllocation unknown;
    assert(f.master->AllocateChunk("/nope", unknown).code() == ErrorCode::kUnknownFile);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 3: Too few alive chunkservers leaves no trace
// ============================================================================
void test_insufficient_replicas() {
    std::cout << "\n=== Test 3: Insufficient replicas ===" << std::endl;
    Fixture f({"cs1", "cs2"});
    f.master->CreateFile("/a");

    ChunkAllocation allocation;
    Status status = f.master->AllocateChunk("/a", allocation);
    assert(status.code() == ErrorCode::kInsufficientReplicas);
    assert(f.master->ChunkCount() == 0);

    std::vector<ChunkHandle> handles;
    f.master->GetFileChunks("/a", handles);
    assert(handles.empty());

    // The failed attempt must not consume a handle
    f.Beat({"cs3"});
    assert(f.master->AllocateChunk("/a", allocation).ok());
    assert(allocation.handle == 1);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 4: Placement rotates over four chunkservers
// ============================================================================
void test_rotation() {
    std::cout << "\n=== Test 4: Placement rotation ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3", "cs4"});
    f.master->CreateFile("/a");

    std::vector<std::vector<ChunkserverId>> expected = {
        {"cs1", "cs2", "cs3"},
        {"cs1", "cs2", "cs4"},
        {"cs1", "cs3", "cs4"},
    };
    for (const auto& replicas : expected) {
        ChunkAllocation allocation;
        assert(f.master->AllocateChunk("/a", allocation).ok());
        assert(allocation.replicas == replicas);
    }

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 5: Leases are stable while valid
// ============================================================================
void test_lease_idempotent() {
    std::cout << "\n=== Test 5: Lease reuse ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3"});
    f.master->CreateFile("/a");
    ChunkAllocation allocation;
    f.master->AllocateChunk("/a", allocation);

    LeaseGrant first;
    assert(f.master->GetOrGrantLease(allocation.handle, first).ok());
    assert(first.primary == "cs1");
    assert((first.secondaries == std::vector<ChunkserverId>{"cs2", "cs3"}));
    assert(first.version == 1);
    assert(first.expiry == f.clock->Now() + 60s);

    f.clock->Advance(10s);
    LeaseGrant second;
    assert(f.master->GetOrGrantLease(allocation.handle, second).ok());
    assert(second.primary == first.primary);
    assert(second.version == first.version);
    assert(second.expiry == first.expiry);

    ChunkLocations locations;
    assert(f.master->GetChunkLocations(allocation.handle, locations).ok());
    assert(locations.primary && *locations.primary == "cs1");

    LeaseGrant missing;
    assert(f.master->GetOrGrantLease(42, missing).code() == ErrorCode::kUnknownChunk);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 6: Expired lease is re-granted with a new version
// ============================================================================
void test_lease_expiry() {
    std::cout << "\n=== Test 6: Lease expiry ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3"});
    f.master->CreateFile("/a");
    ChunkAllocation allocation;
    f.master->AllocateChunk("/a", allocation);

    LeaseGrant first;
    f.master->GetOrGrantLease(allocation.handle, first);

    // cs1 goes silent while the others keep reporting
    for (int i = 0; i < 61; ++i) {
        f.clock->Advance(1s);
        f.Beat({"cs2", "cs3"});
    }

    ChunkLocations locations;
    f.master->GetChunkLocations(allocation.handle, locations);
    assert(!locations.primary.has_value() && "expired lease is not reported");
    assert((locations.alive_replicas == std::vector<ChunkserverId>{"cs2", "cs3"}));

    LeaseGrant second;
    assert(f.master->GetOrGrantLease(allocation.handle, second).ok());
    assert(second.primary == "cs2");
    assert((second.secondaries == std::vector<ChunkserverId>{"cs1", "cs3"}));
    assert(second.version == first.version + 1);
    assert(second.expiry > first.expiry);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 7: Revoke
// ============================================================================
void test_revoke_lease() {
    std::cout << "\n=== Test 7: Revoke lease ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3"});
    f.master->CreateFile("/a");
    ChunkAllocation allocation;
    f.master->AllocateChunk("/a", allocation);

    LeaseGrant first;
    f.master->GetOrGrantLease(allocation.handle, first);
    assert(f.master->RevokeLease(allocation.handle).ok());

    ChunkLocations locations;
    f.master->GetChunkLocations(allocation.handle, locations);
    assert(!locations.primary.has_value());

    LeaseGrant second;
    f.master->GetOrGrantLease(allocation.handle, second);
    assert(second.version == first.version + 1);

    assert(f.master->RevokeLease(999).code() == ErrorCode::kUnknownChunk);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 8: Dead chunkservers are excluded
// ============================================================================
void test_liveness_exclusion() {
    std::cout << "\n=== Test 8: Liveness exclusion ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3", "cs4"});
    f.master->CreateFile("/a");

    f.clock->Advance(2s);
    f.Beat({"cs2", "cs3", "cs4"});
    f.clock->Advance(2s);
    f.Beat({"cs2", "cs3", "cs4"});

    auto alive = f.master->AliveChunkservers();
    assert((alive == std::vector<ChunkserverId>{"cs2", "cs3", "cs4"}));

    ChunkAllocation allocation;
    assert(f.master->AllocateChunk("/a", allocation).ok());
    assert((allocation.replicas == std::vector<ChunkserverId>{"cs2", "cs3", "cs4"}));

    // A late heartbeat revives it
    f.Beat({"cs1"});
    alive = f.master->CheckLiveness();
    assert(alive.size() == 4);

    // Timestamps never move last-seen backwards
    f.clock->Advance(2s);
    f.master->Heartbeat("cs1", {}, 0ms);
    f.clock->Advance(2s);
    alive = f.master->CheckLiveness();
    assert(alive.empty() && "nobody beat for 4s");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 9: Observer fires once per death with under-replicated chunks
// ============================================================================
void test_liveness_observer() {
    std::cout << "\n=== Test 9: Liveness observer ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3", "cs4"});
    f.master->CreateFile("/a");

    ChunkAllocation c1, c2, c3;
    f.master->AllocateChunk("/a", c1);  // cs1 cs2 cs3
    f.master->AllocateChunk("/a", c2);  // cs1 cs2 cs4
    f.master->AllocateChunk("/a", c3);  // cs1 cs3 cs4

    std::vector<std::pair<ChunkserverId, std::vector<ChunkHandle>>> events;
    f.master->AddLivenessObserver(
        [&events](const ChunkserverId& id, const std::vector<ChunkHandle>& handles) {
            events.push_back({id, handles});
        });

    f.clock->Advance(2s);
    f.Beat({"cs1", "cs3", "cs4"});
    f.clock->Advance(2s);

    f.master->CheckLiveness();
    assert(events.size() == 1);
    assert(events[0].first == "cs2");
    assert((events[0].second == std::vector<ChunkHandle>{c1.handle, c2.handle}));

    // Already dead: no repeat
    f.master->CheckLiveness();
    ChunkLocations locations;
    f.master->GetChunkLocations(c1.handle, locations);
    assert(events.size() == 1);
    assert((locations.alive_replicas == std::vector<ChunkserverId>{"cs1", "cs3"}));
    assert(locations.replicas.size() == 3);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 10: No alive replica means no lease
// ============================================================================
void test_chunk_unavailable() {
    std::cout << "\n=== Test 10: Chunk unavailable ===" << std::endl;
    Fixture f({"cs1", "cs2", "cs3"});
    f.master->CreateFile("/a");
    ChunkAllocation allocation;
    f.master->AllocateChunk("/a", allocation);

    f.clock->Advance(10s);
    LeaseGrant lease;
    assert(f.master->GetOrGrantLease(allocation.handle, lease).code() ==
           ErrorCode::kChunkUnavailable);

    f.Beat({"cs3"});
    assert(f.master->GetOrGrantLease(allocation.handle, lease).ok());
    assert(lease.primary == "cs3");
    assert((lease.secondaries == std::vector<ChunkserverId>{"cs1", "cs2"}));

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 11: A late heartbeat does not hide a death from the sweep
// ============================================================================
void test_stale_heartbeat_after_death() {
    std::cout << "\n=== Test 11: Stale heartbeat after death ===" << std::endl;
    Fixture f({"cs1"}, 1);
    gfs_common::Timestamp first_beat = f.clock->Now();
    f.master->CreateFile("/a");
    ChunkAllocation allocation;
    assert(f.master->AllocateChunk("/a", allocation).ok());

    std::vector<ChunkserverId> dead;
    f.master->AddLivenessObserver(
        [&dead](const ChunkserverId& id, const std::vector<ChunkHandle>&) {
            dead.push_back(id);
        });

    // Sent 1s after the first beat, delivered 5s after it
    f.clock->Advance(5s);
    f.master->Heartbeat("cs1", {allocation.handle}, first_beat + 1s);

    assert(f.master->CheckLiveness().empty());
    assert((dead == std::vector<ChunkserverId>{"cs1"}));

    // A fresh beat revives it without another event
    f.Beat({"cs1"});
    assert((f.master->CheckLiveness() == std::vector<ChunkserverId>{"cs1"}));
    assert(dead.size() == 1);

    std::cout << "  PASSED!" << std::endl;
}

int main() {
    std::cout << "\n======================================" << std::endl;
    std::cout << "  Master Tests" << std::endl;
    std::cout << "======================================" << std::endl;

    test_create_file();
    test_allocate_chunk();
    test_insufficient_replicas();
    test_rotation();
    test_lease_idempotent();
    test_lease_expiry();
    test_revoke_lease();
    test_liveness_exclusion();
    test_liveness_observer();
    test_chunk_unavailable();
    test_stale_heartbeat_after_death();

    std::cout << "\n======================================" << std::endl;
    std::cout << "  All 11 tests PASSED!" << std::endl;
    std::cout << "======================================\n" << std::endl;
    return 0;
}
