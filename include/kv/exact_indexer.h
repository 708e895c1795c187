#pragma once

#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "kv/kv_indexer.h"

namespace kvplane {

/// Indexer driven by explicit add/remove events from workers.
class ExactIndexer : public KvIndexer {
public:
    explicit ExactIndexer(WorkerRegistry* registry = nullptr);
    ~ExactIndexer() override;

    OverlapScores findMatches(const std::vector<SequenceHash>& block_hashes) const override;
    void applyEvent(const KvCacheEvent& event) override;
    void removeWorkerRank(const WorkerRef& worker) override;
    void clearAllBlocks(WorkerId worker_id) override;
    std::vector<KvCacheEvent> dumpEvents() const override;
    size_t blockCount() const override;
    void clear() override;
    IndexerMode mode() const override { return IndexerMode::kExact; }

    /// Blocks held by one worker (0 when unknown).
    size_t workerBlockCount(const WorkerRef& worker) const;

protected:
    std::vector<WorkerRef> knownRanks(WorkerId worker_id) const override;

private:
    void dropWorkerLocked(const WorkerRef& worker);

    mutable std::shared_mutex mutex_;
    std::unordered_map<SequenceHash, std::set<WorkerRef>> blocks_;
    std::unordered_map<WorkerRef, std::unordered_set<SequenceHash>> worker_blocks_;
};

}  // namespace kvplane
