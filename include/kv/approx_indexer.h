#pragma once

#include <chrono>
#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "kv/kv_indexer.h"

namespace kvplane {

/// Indexer for workers that publish no eviction events.
///
/// A worker is assumed to hold a block for `ttl` after it was last routed a
/// request containing that block. Once the TTL elapses the block counts as
/// evicted, so the estimate errs toward "not cached".
class ApproxIndexer : public KvIndexer {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    explicit ApproxIndexer(WorkerRegistry* registry = nullptr,
                           std::chrono::milliseconds ttl = std::chrono::seconds(120),
                           Clock clock = {});
    ~ApproxIndexer() override;

    OverlapScores findMatches(const std::vector<SequenceHash>& block_hashes) const override;

    /// `added` refreshes the TTL, `removed` and `cleared` take effect at once.
    void applyEvent(const KvCacheEvent& event) override;
    void removeWorkerRank(const WorkerRef& worker) override;
    void clearAllBlocks(WorkerId worker_id) override;
    void recordRouting(const WorkerRef& worker, const std::vector<SequenceHash>& block_hashes) override;
    std::vector<KvCacheEvent> dumpEvents() const override;

    /// Includes entries that expired but were not yet pruned.
    size_t blockCount() const override;
    void clear() override;
    IndexerMode mode() const override { return IndexerMode::kApproximate; }

    /// Drop every expired entry. Returns the number of (block, worker) pairs dropped.
    size_t pruneExpired();

    std::chrono::milliseconds ttl() const { return ttl_; }

protected:
    std::vector<WorkerRef> knownRanks(WorkerId worker_id) const override;

private:
    TimePoint now() const;
    void touchLocked(const WorkerRef& worker, SequenceHash hash, TimePoint expiry);
    void eraseLocked(const WorkerRef& worker, SequenceHash hash);
    void dropWorkerLocked(const WorkerRef& worker);
    size_t pruneExpiredLocked(TimePoint now);

    std::chrono::milliseconds ttl_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    // block -> worker -> expiry
    std::unordered_map<SequenceHash, std::unordered_map<WorkerRef, TimePoint>> blocks_;
    std::unordered_map<WorkerRef, std::unordered_set<SequenceHash>> worker_blocks_;
    TimePoint last_prune_{};
};

}  // namespace kvplane
