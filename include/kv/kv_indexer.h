#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "discovery/worker_ref.h"
#include "kv/block_hash.h"
#include "kv/kv_event.h"

namespace kvplane {

class WorkerRegistry;

/// Per-worker matched-prefix lengths for one candidate sequence.
struct OverlapScores {
    std::unordered_map<WorkerRef, uint32_t> scores;
    /// frequencies[i] = number of workers still matching at block i.
    std::vector<size_t> frequencies;

    uint32_t scoreFor(const WorkerRef& worker) const {
        auto it = scores.find(worker);
        return it == scores.end() ? 0 : it->second;
    }
};

enum class IndexerMode {
    kExact,
    kApproximate,
    kDisabled,
};

const char* to_string(IndexerMode mode);
IndexerMode parseIndexerMode(const std::string& text);

struct IndexerConfig {
    IndexerMode mode{IndexerMode::kExact};
    std::chrono::milliseconds ttl{std::chrono::seconds(120)};
};

/// Maps KV-cache blocks to the workers holding them.
///
/// Lookups may run concurrently; mutations are serialized internally. When a
/// registry is supplied the indexer drops blocks of a worker synchronously
/// with its removal, ignores events for unregistered workers, and never
/// reports overlap for a worker the registry does not know.
class KvIndexer {
public:
    explicit KvIndexer(WorkerRegistry* registry) : registry_(registry) {}
    virtual ~KvIndexer() = default;

    KvIndexer(const KvIndexer&) = delete;
    KvIndexer& operator=(const KvIndexer&) = delete;

    virtual OverlapScores findMatches(const std::vector<SequenceHash>& block_hashes) const = 0;
    virtual void applyEvent(const KvCacheEvent& event) = 0;

    /// Evict every dp rank of a worker.
    void removeWorker(WorkerId worker_id);
    virtual void removeWorkerRank(const WorkerRef& worker) = 0;

    /// Forget a worker's blocks while keeping it routable.
    virtual void clearAllBlocks(WorkerId worker_id) = 0;

    /// Feedback from a routing decision. Only the approximate indexer uses it.
    virtual void recordRouting(const WorkerRef& worker, const std::vector<SequenceHash>& block_hashes);

    /// Current contents as a replayable stream of `added` events.
    virtual std::vector<KvCacheEvent> dumpEvents() const = 0;

    virtual size_t blockCount() const = 0;
    virtual void clear() = 0;
    virtual IndexerMode mode() const = 0;

protected:
    bool isRegistered(const WorkerRef& worker) const;
    virtual std::vector<WorkerRef> knownRanks(WorkerId worker_id) const = 0;

    // Variants call watchRegistry() last in their constructor and
    // unwatchRegistry() first in their destructor, so removal callbacks only
    // ever see a fully constructed object.
    void watchRegistry();
    void unwatchRegistry();

    WorkerRegistry* registry_{nullptr};

private:
    size_t subscription_id_{0};
};

/// Always reports zero overlap.
class DisabledIndexer : public KvIndexer {
public:
    explicit DisabledIndexer(WorkerRegistry* registry) : KvIndexer(registry) {}

    OverlapScores findMatches(const std::vector<SequenceHash>&) const override { return {}; }
    void applyEvent(const KvCacheEvent&) override {}
    void removeWorkerRank(const WorkerRef&) override {}
    void clearAllBlocks(WorkerId) override {}
    std::vector<KvCacheEvent> dumpEvents() const override { return {}; }
    size_t blockCount() const override { return 0; }
    void clear() override {}
    IndexerMode mode() const override { return IndexerMode::kDisabled; }

protected:
    std::vector<WorkerRef> knownRanks(WorkerId) const override { return {}; }
};

std::unique_ptr<KvIndexer> makeIndexer(const IndexerConfig& config, WorkerRegistry* registry);

}  // namespace kvplane
