#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "gfs_master/metadata_store.hpp"
#include "gfs_master/replica_selector.hpp"

using namespace std::chrono_literals;
using gfs_master::ChunkserverId;

// ============================================================================
// Test 1: Files
// ============================================================================
void test_files() {
    std::cout << "\n=== Test 1: Files ===" << std::endl;

    gfs_master::MetadataStore store;
    assert(!store.FileExists("/a"));
    assert(store.AddFile("/a"));
    assert(!store.AddFile("/a") && "duplicate path must be rejected");
    assert(store.FileExists("/a"));
    assert(store.FileCount() == 1);

    auto* file = store.FindFile("/a");
    assert(file != nullptr);
    assert(file->path == "/a");
    assert(file->chunk_handles.empty());
    assert(store.FindFile("/missing") == nullptr);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 2: Chunk handles are issued in order, starting at 1
// ============================================================================
void test_chunks() {
    std::cout << "\n=== Test 2: Chunk handles ===" << std::endl;

    gfs_master::MetadataStore store;
    store.AddFile("/a");
    store.AddFile("/b");
    assert(store.PeekNextHandle() == 1);

    auto h1 = store.AddChunk("/a", {"cs1", "cs2", "cs3"});
    auto h2 = store.AddChunk("/b", {"cs1", "cs2", "cs3"});
    auto h3 = store.AddChunk("/a", {"cs2", "cs3", "cs4"});
    assert(h1 == 1 && h2 == 2 && h3 == 3);
    assert(store.PeekNextHandle() == 4);
    assert(store.ChunkCount() == 3);

    assert((store.FindFile("/a")->chunk_handles == std::vector<uint64_t>{1, 3}));
    assert((store.FindFile("/b")->chunk_handles == std::vector<uint64_t>{2}));

    auto* chunk = store.FindChunk(h3);
    assert(chunk != nullptr);
    assert(chunk->handle == 3);
    assert(chunk->version == 0);
    assert((chunk->replicas == std::vector<ChunkserverId>{"cs2", "cs3", "cs4"}));
    assert(!chunk->primary.has_value());
    assert(store.FindChunk(99) == nullptr);
    assert(!store.ChunkExists(0));

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 3: Lease validity is strict on expiry
// ============================================================================
void test_lease_validity() {
    std::cout << "\n=== Test 3: Lease validity ===" << std::endl;

    gfs_master::ChunkMetadata chunk(1, {"cs1", "cs2", "cs3"});
    assert(!chunk.HasValidLease(0ms));

    chunk.primary = "cs1";
    chunk.lease_expiry = 1000ms;
    assert(chunk.HasValidLease(999ms));
    assert(!chunk.HasValidLease(1000ms));

    chunk.ClearLease();
    assert(!chunk.primary.has_value());
    assert(!chunk.lease_expiry.has_value());
    assert(!chunk.HasValidLease(0ms));

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 4: Chunkserver registry is ordered by id
// ============================================================================
void test_registry() {
    std::cout << "\n=== Test 4: Chunkserver registry ===" << std::endl;

    gfs_master::MetadataStore store;
    auto [cs3, new3] = store.UpsertChunkserver("cs3");
    assert(new3);
    cs3->last_heartbeat = 50ms;
    store.UpsertChunkserver("cs1");

    auto [again, new_again] = store.UpsertChunkserver("cs3");
    assert(!new_again);
    assert(again->last_heartbeat == 50ms);

    std::vector<ChunkserverId> ids;
    for (const auto& entry : store.chunkservers()) {
        ids.push_back(entry.first);
    }
    assert((ids == std::vector<ChunkserverId>{"cs1", "cs3"}));
    assert(store.FindChunkserver("cs2") == nullptr);

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 5: Round-robin placement
// ============================================================================
void test_replica_selector() {
    std::cout << "\n=== Test 5: Round-robin placement ===" << std::endl;

    gfs_master::ReplicaSelector selector(3);
    std::vector<ChunkserverId> alive = {"cs1", "cs2", "cs3", "cs4"};

    auto first = selector.SelectForAllocation(alive);
    auto second = selector.SelectForAllocation(alive);
    auto third = selector.SelectForAllocation(alive);
    assert((first == std::vector<ChunkserverId>{"cs1", "cs2", "cs3"}));
    assert((second == std::vector<ChunkserverId>{"cs1", "cs2", "cs4"}));
    assert((third == std::vector<ChunkserverId>{"cs1", "cs3", "cs4"}));

    // Too few alive: nothing chosen, rotation untouched
    gfs_master::ReplicaSelector fresh(3);
    assert(fresh.SelectForAllocation({"cs1", "cs2"}).empty());
    assert((fresh.SelectForAllocation(alive) == std::vector<ChunkserverId>{"cs1", "cs2", "cs3"}));

    auto primary = gfs_master::ReplicaSelector::SelectPrimary(
        {"cs3", "cs1", "cs2"}, [](const ChunkserverId& id) { return id != "cs1"; });
    assert(primary && *primary == "cs2");

    auto none = gfs_master::ReplicaSelector::SelectPrimary(
        {"cs1", "cs2"}, [](const ChunkserverId&) { return false; });
    assert(!none);

    std::cout << "  PASSED!" << std::endl;
}

int main() {
    std::cout << "\n======================================" << std::endl;
    std::cout << "  MetadataStore / ReplicaSelector Tests" << std::endl;
    std::cout << "======================================" << std::endl;

    test_files();
    test_chunks();
    test_lease_validity();
    test_registry();
    test_replica_selector();

    std::cout << "\n======================================" << std::endl;
    std::cout << "  All 5 tests PASSED!" << std::endl;
    std::cout << "======================================\n" << std::endl;
    return 0;
}
