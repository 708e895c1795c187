#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

#include "discovery/worker_registry.h"
#include "kv/approx_indexer.h"
#include "kv/exact_indexer.h"

namespace kvplane {
namespace {

using namespace std::chrono_literals;

KvCacheEvent added(WorkerRef worker, SequenceHash hash, uint64_t id = 0) {
    KvCacheEvent e;
    e.event_id = id;
    e.worker = worker;
    e.block_hash = hash;
    e.action = KvEventAction::kAdded;
    return e;
}

KvCacheEvent removed(WorkerRef worker, SequenceHash hash) {
    KvCacheEvent e = added(worker, hash);
    e.action = KvEventAction::kRemoved;
    return e;
}

KvCacheEvent cleared(WorkerRef worker) {
    KvCacheEvent e;
    e.worker = worker;
    e.action = KvEventAction::kCleared;
    return e;
}

const WorkerRef kW1{1, 0};
const WorkerRef kW2{2, 0};
const WorkerRef kW3{3, 0};

class ExactIndexerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.addWorker(kW1);
        registry.addWorker(kW2);
        registry.addWorker(kW3);
        indexer = std::make_unique<ExactIndexer>(&registry);
    }

    WorkerRegistry registry;
    std::unique_ptr<ExactIndexer> indexer;
};

TEST_F(ExactIndexerTest, CountsContiguousPrefixFromFirstBlock) {
    for (SequenceHash h : {10, 11, 12}) indexer->applyEvent(added(kW1, h));
    for (SequenceHash h : {10, 11}) indexer->applyEvent(added(kW2, h));
    // W3 holds later blocks but not the first one.
    for (SequenceHash h : {11, 12}) indexer->applyEvent(added(kW3, h));

    auto scores = indexer->findMatches({10, 11, 12, 13});
    EXPECT_EQ(scores.scoreFor(kW1), 3u);
    EXPECT_EQ(scores.scoreFor(kW2), 2u);
    EXPECT_EQ(scores.scoreFor(kW3), 0u);
    EXPECT_EQ(scores.frequencies, (std::vector<size_t>{2, 2, 1}));
}

TEST_F(ExactIndexerTest, GapStopsTheMatch) {
    for (SequenceHash h : {10, 12}) indexer->applyEvent(added(kW1, h));
    auto scores = indexer->findMatches({10, 11, 12});
    EXPECT_EQ(scores.scoreFor(kW1), 1u);
}

TEST_F(ExactIndexerTest, DuplicateEventsAreNoOps) {
    indexer->applyEvent(added(kW1, 10, 1));
    indexer->applyEvent(added(kW1, 10, 1));
    EXPECT_EQ(indexer->blockCount(), 1u);
    EXPECT_EQ(indexer->workerBlockCount(kW1), 1u);

    indexer->applyEvent(removed(kW1, 10));
    indexer->applyEvent(removed(kW1, 10));
    EXPECT_EQ(indexer->blockCount(), 0u);
    EXPECT_EQ(indexer->workerBlockCount(kW1), 0u);
}

TEST_F(ExactIndexerTest, RemovingLastHolderDropsTheBlock) {
    indexer->applyEvent(added(kW1, 10));
    indexer->applyEvent(added(kW2, 10));
    indexer->applyEvent(removed(kW1, 10));
    EXPECT_EQ(indexer->blockCount(), 1u);
    indexer->applyEvent(removed(kW2, 10));
    EXPECT_EQ(indexer->blockCount(), 0u);
}

TEST_F(ExactIndexerTest, ClearedEventDropsOnlyThatWorker) {
    for (SequenceHash h : {10, 11}) {
        indexer->applyEvent(added(kW1, h));
        indexer->applyEvent(added(kW2, h));
    }
    indexer->applyEvent(cleared(kW1));

    auto scores = indexer->findMatches({10, 11});
    EXPECT_EQ(scores.scoreFor(kW1), 0u);
    EXPECT_EQ(scores.scoreFor(kW2), 2u);
    EXPECT_TRUE(registry.contains(kW1));
}

TEST_F(ExactIndexerTest, EventsForUnregisteredWorkersAreIgnored) {
    indexer->applyEvent(added(WorkerRef{42, 0}, 10));
    EXPECT_EQ(indexer->blockCount(), 0u);
}

TEST_F(ExactIndexerTest, RegistryRemovalEvictsBlocksSynchronously) {
    for (SequenceHash h : {10, 11}) indexer->applyEvent(added(kW2, h));
    ASSERT_EQ(indexer->findMatches({10, 11}).scoreFor(kW2), 2u);

    registry.removeWorker(kW2);

    EXPECT_EQ(indexer->findMatches({10, 11}).scoreFor(kW2), 0u);
    EXPECT_EQ(indexer->workerBlockCount(kW2), 0u);
    EXPECT_EQ(indexer->blockCount(), 0u);
}

TEST_F(ExactIndexerTest, RemoveWorkerDropsEveryRank) {
    const WorkerRef rank0{5, 0};
    const WorkerRef rank1{5, 1};
    registry.addWorker(rank0);
    registry.addWorker(rank1);
    indexer->applyEvent(added(rank0, 10));
    indexer->applyEvent(added(rank1, 10));
    indexer->applyEvent(added(kW1, 10));

    indexer->removeWorker(5);

    auto scores = indexer->findMatches({10});
    EXPECT_EQ(scores.scoreFor(rank0), 0u);
    EXPECT_EQ(scores.scoreFor(rank1), 0u);
    EXPECT_EQ(scores.scoreFor(kW1), 1u);
}

TEST_F(ExactIndexerTest, DumpEventsRebuildsAnEquivalentIndex) {
    for (SequenceHash h : {10, 11, 12}) indexer->applyEvent(added(kW1, h));
    indexer->applyEvent(added(kW2, 10));

    auto events = indexer->dumpEvents();
    ASSERT_EQ(events.size(), 4u);

    ExactIndexer rebuilt(&registry);
    for (const auto& e : events) rebuilt.applyEvent(e);

    auto a = indexer->findMatches({10, 11, 12});
    auto b = rebuilt.findMatches({10, 11, 12});
    EXPECT_EQ(a.scores, b.scores);
    EXPECT_EQ(a.frequencies, b.frequencies);
}

TEST(ExactIndexerStandaloneTest, WorksWithoutRegistry) {
    ExactIndexer indexer;
    indexer.applyEvent(added(kW1, 10));
    EXPECT_EQ(indexer.findMatches({10}).scoreFor(kW1), 1u);
    indexer.clear();
    EXPECT_EQ(indexer.blockCount(), 0u);
}

class FakeClock {
public:
    ApproxIndexer::TimePoint now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }

private:
    ApproxIndexer::TimePoint now_{std::chrono::steady_clock::time_point{} + 1h};
};

TEST(ApproxIndexerTest, RoutedBlocksCountUntilTtlElapses) {
    FakeClock clock;
    WorkerRegistry registry;
    registry.addWorker(kW1);
    ApproxIndexer indexer(&registry, 1000ms, [&] { return clock.now(); });

    indexer.recordRouting(kW1, {10, 11});
    EXPECT_EQ(indexer.findMatches({10, 11}).scoreFor(kW1), 2u);

    clock.advance(999ms);
    EXPECT_EQ(indexer.findMatches({10, 11}).scoreFor(kW1), 2u);

    clock.advance(1ms);
    EXPECT_EQ(indexer.findMatches({10, 11}).scoreFor(kW1), 0u);
    EXPECT_TRUE(indexer.dumpEvents().empty());
    EXPECT_EQ(indexer.pruneExpired(), 2u);
    EXPECT_EQ(indexer.blockCount(), 0u);
}

TEST(ApproxIndexerTest, RoutingAgainRefreshesTtl) {
    FakeClock clock;
    ApproxIndexer indexer(nullptr, 1000ms, [&] { return clock.now(); });

    indexer.recordRouting(kW1, {10});
    clock.advance(800ms);
    indexer.recordRouting(kW1, {10});
    clock.advance(800ms);
    EXPECT_EQ(indexer.findMatches({10}).scoreFor(kW1), 1u);
}

TEST(ApproxIndexerTest, RemovedEventTakesEffectImmediately) {
    FakeClock clock;
    ApproxIndexer indexer(nullptr, 1000ms, [&] { return clock.now(); });

    indexer.applyEvent(added(kW1, 10));
    indexer.applyEvent(removed(kW1, 10));
    EXPECT_EQ(indexer.findMatches({10}).scoreFor(kW1), 0u);
}

TEST(ApproxIndexerTest, RoutingToUnregisteredWorkerIsIgnored) {
    WorkerRegistry registry;
    ApproxIndexer indexer(&registry, 1000ms);
    indexer.recordRouting(kW1, {10});
    EXPECT_EQ(indexer.blockCount(), 0u);
}

TEST(ApproxIndexerTest, RegistryRemovalEvictsBlocks) {
    WorkerRegistry registry;
    registry.addWorker(kW1);
    ApproxIndexer indexer(&registry, 60000ms);
    indexer.recordRouting(kW1, {10, 11});

    registry.removeWorker(kW1);
    EXPECT_EQ(indexer.blockCount(), 0u);
}

TEST(IndexerFactoryTest, BuildsRequestedMode) {
    IndexerConfig config;
    config.mode = IndexerMode::kApproximate;
    EXPECT_EQ(makeIndexer(config, nullptr)->mode(), IndexerMode::kApproximate);
    config.mode = IndexerMode::kDisabled;
    auto disabled = makeIndexer(config, nullptr);
    disabled->applyEvent(added(kW1, 10));
    EXPECT_TRUE(disabled->findMatches({10}).scores.empty());
}

TEST(IndexerFactoryTest, ParsesModeNames) {
    EXPECT_EQ(parseIndexerMode("approx"), IndexerMode::kApproximate);
    EXPECT_EQ(parseIndexerMode("EXACT"), IndexerMode::kExact);
    EXPECT_EQ(parseIndexerMode("off"), IndexerMode::kDisabled);
    EXPECT_EQ(parseIndexerMode("bogus"), IndexerMode::kExact);
}

}  // namespace
}  // namespace kvplane
