#include "kv/exact_indexer.h"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace kvplane {

ExactIndexer::ExactIndexer(WorkerRegistry* registry)
    : KvIndexer(registry) {
    watchRegistry();
}

ExactIndexer::~ExactIndexer() {
    unwatchRegistry();
}

OverlapScores ExactIndexer::findMatches(const std::vector<SequenceHash>& block_hashes) const {
    OverlapScores result;
    if (block_hashes.empty()) {
        return result;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto first = blocks_.find(block_hashes.front());
    if (first == blocks_.end()) {
        return result;
    }

    // Only workers matching from block 0 can score; each later block can only
    // shrink the set.
    std::vector<WorkerRef> active;
    active.reserve(first->second.size());
    for (const auto& worker : first->second) {
        if (isRegistered(worker)) {
            active.push_back(worker);
        }
    }

    for (size_t i = 0; i < block_hashes.size() && !active.empty(); ++i) {
        if (i > 0) {
            auto it = blocks_.find(block_hashes[i]);
            if (it == blocks_.end()) {
                break;
            }
            const auto& holders = it->second;
            active.erase(std::remove_if(active.begin(), active.end(),
                                        [&](const WorkerRef& w) { return holders.count(w) == 0; }),
                         active.end());
            if (active.empty()) {
                break;
            }
        }
        for (const auto& worker : active) {
            result.scores[worker] += 1;
        }
        result.frequencies.push_back(active.size());
    }
    return result;
}

void ExactIndexer::applyEvent(const KvCacheEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Checked under the write lock so a concurrent registry removal either
    // runs before (event dropped) or after (event evicted with the worker).
    if (!isRegistered(event.worker)) {
        spdlog::debug("Ignoring KV event {} for unregistered worker {}", event.event_id,
                      to_string(event.worker));
        return;
    }

    switch (event.action) {
        case KvEventAction::kAdded: {
            blocks_[event.block_hash].insert(event.worker);
            worker_blocks_[event.worker].insert(event.block_hash);
            break;
        }
        case KvEventAction::kRemoved: {
            auto it = blocks_.find(event.block_hash);
            if (it != blocks_.end()) {
                it->second.erase(event.worker);
                if (it->second.empty()) {
                    blocks_.erase(it);
                }
            }
            auto wit = worker_blocks_.find(event.worker);
            if (wit != worker_blocks_.end()) {
                wit->second.erase(event.block_hash);
                if (wit->second.empty()) {
                    worker_blocks_.erase(wit);
                }
            }
            break;
        }
        case KvEventAction::kCleared:
            dropWorkerLocked(event.worker);
            break;
    }
}

void ExactIndexer::dropWorkerLocked(const WorkerRef& worker) {
    auto wit = worker_blocks_.find(worker);
    if (wit == worker_blocks_.end()) {
        return;
    }
    for (SequenceHash hash : wit->second) {
        auto it = blocks_.find(hash);
        if (it == blocks_.end()) continue;
        it->second.erase(worker);
        if (it->second.empty()) {
            blocks_.erase(it);
        }
    }
    worker_blocks_.erase(wit);
}

void ExactIndexer::removeWorkerRank(const WorkerRef& worker) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    dropWorkerLocked(worker);
    spdlog::debug("Evicted KV blocks of worker {}", to_string(worker));
}

void ExactIndexer::clearAllBlocks(WorkerId worker_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<WorkerRef> ranks;
    for (const auto& [worker, hashes] : worker_blocks_) {
        if (worker.worker_id == worker_id) {
            ranks.push_back(worker);
        }
    }
    for (const auto& worker : ranks) {
        dropWorkerLocked(worker);
    }
}

std::vector<WorkerRef> ExactIndexer::knownRanks(WorkerId worker_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<WorkerRef> ranks;
    for (const auto& [worker, hashes] : worker_blocks_) {
        if (worker.worker_id == worker_id) {
            ranks.push_back(worker);
        }
    }
    return ranks;
}

std::vector<KvCacheEvent> ExactIndexer::dumpEvents() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<SequenceHash, WorkerRef>> pairs;
    for (const auto& [hash, workers] : blocks_) {
        for (const auto& worker : workers) {
            pairs.emplace_back(hash, worker);
        }
    }
    std::sort(pairs.begin(), pairs.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second < b.second;
        return a.first < b.first;
    });

    std::vector<KvCacheEvent> events;
    events.reserve(pairs.size());
    uint64_t event_id = 0;
    for (const auto& [hash, worker] : pairs) {
        KvCacheEvent event;
        event.event_id = event_id++;
        event.block_hash = hash;
        event.worker = worker;
        event.action = KvEventAction::kAdded;
        events.push_back(event);
    }
    return events;
}

size_t ExactIndexer::blockCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blocks_.size();
}

size_t ExactIndexer::workerBlockCount(const WorkerRef& worker) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = worker_blocks_.find(worker);
    return it == worker_blocks_.end() ? 0 : it->second.size();
}

void ExactIndexer::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    blocks_.clear();
    worker_blocks_.clear();
}

}  // namespace kvplane
