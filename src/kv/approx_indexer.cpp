#include "kv/approx_indexer.h"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace kvplane {

ApproxIndexer::ApproxIndexer(WorkerRegistry* registry, std::chrono::milliseconds ttl, Clock clock)
    : KvIndexer(registry)
    , ttl_(ttl)
    , clock_(std::move(clock)) {
    if (ttl_.count() <= 0) {
        ttl_ = std::chrono::seconds(120);
    }
    last_prune_ = now();
    watchRegistry();
}

ApproxIndexer::~ApproxIndexer() {
    unwatchRegistry();
}

ApproxIndexer::TimePoint ApproxIndexer::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

OverlapScores ApproxIndexer::findMatches(const std::vector<SequenceHash>& block_hashes) const {
    OverlapScores result;
    if (block_hashes.empty()) {
        return result;
    }
    const TimePoint t = now();

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto first = blocks_.find(block_hashes.front());
    if (first == blocks_.end()) {
        return result;
    }

    std::vector<WorkerRef> active;
    size_t expired = 0;
    for (const auto& [worker, expiry] : first->second) {
        if (t >= expiry) {
            ++expired;
            continue;
        }
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
                                        [&](const WorkerRef& w) {
                                            auto h = holders.find(w);
                                            if (h == holders.end()) return true;
                                            if (t >= h->second) {
                                                ++expired;
                                                return true;
                                            }
                                            return false;
                                        }),
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

    if (expired > 0) {
        spdlog::debug("Approximate overlap degraded: {} cached block entries past TTL", expired);
    }
    return result;
}

void ApproxIndexer::touchLocked(const WorkerRef& worker, SequenceHash hash, TimePoint expiry) {
    blocks_[hash][worker] = expiry;
    worker_blocks_[worker].insert(hash);
}

void ApproxIndexer::eraseLocked(const WorkerRef& worker, SequenceHash hash) {
    auto it = blocks_.find(hash);
    if (it != blocks_.end()) {
        it->second.erase(worker);
        if (it->second.empty()) {
            blocks_.erase(it);
        }
    }
    auto wit = worker_blocks_.find(worker);
    if (wit != worker_blocks_.end()) {
        wit->second.erase(hash);
        if (wit->second.empty()) {
            worker_blocks_.erase(wit);
        }
    }
}

void ApproxIndexer::dropWorkerLocked(const WorkerRef& worker) {
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

size_t ApproxIndexer::pruneExpiredLocked(TimePoint t) {
    size_t dropped = 0;
    for (auto it = blocks_.begin(); it != blocks_.end();) {
        auto& holders = it->second;
        for (auto h = holders.begin(); h != holders.end();) {
            if (t >= h->second) {
                auto wit = worker_blocks_.find(h->first);
                if (wit != worker_blocks_.end()) {
                    wit->second.erase(it->first);
                    if (wit->second.empty()) {
                        worker_blocks_.erase(wit);
                    }
                }
                h = holders.erase(h);
                ++dropped;
            } else {
                ++h;
            }
        }
        if (holders.empty()) {
            it = blocks_.erase(it);
        } else {
            ++it;
        }
    }
    last_prune_ = t;
    if (dropped > 0) {
        spdlog::debug("Approximate indexer pruned {} expired block entries", dropped);
    }
    return dropped;
}

size_t ApproxIndexer::pruneExpired() {
    const TimePoint t = now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return pruneExpiredLocked(t);
}

void ApproxIndexer::applyEvent(const KvCacheEvent& event) {
    const TimePoint t = now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!isRegistered(event.worker)) {
        spdlog::debug("Ignoring KV event {} for unregistered worker {}", event.event_id,
                      to_string(event.worker));
        return;
    }
    switch (event.action) {
        case KvEventAction::kAdded:
            touchLocked(event.worker, event.block_hash, t + ttl_);
            break;
        case KvEventAction::kRemoved:
            eraseLocked(event.worker, event.block_hash);
            break;
        case KvEventAction::kCleared:
            dropWorkerLocked(event.worker);
            break;
    }
}

void ApproxIndexer::recordRouting(const WorkerRef& worker, const std::vector<SequenceHash>& block_hashes) {
    const TimePoint t = now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!isRegistered(worker)) {
        return;
    }
    // Amortize the full sweep over a quarter TTL.
    if (t - last_prune_ >= ttl_ / 4) {
        pruneExpiredLocked(t);
    }
    const TimePoint expiry = t + ttl_;
    for (SequenceHash hash : block_hashes) {
        touchLocked(worker, hash, expiry);
    }
}

void ApproxIndexer::removeWorkerRank(const WorkerRef& worker) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    dropWorkerLocked(worker);
}

void ApproxIndexer::clearAllBlocks(WorkerId worker_id) {
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

std::vector<WorkerRef> ApproxIndexer::knownRanks(WorkerId worker_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<WorkerRef> ranks;
    for (const auto& [worker, hashes] : worker_blocks_) {
        if (worker.worker_id == worker_id) {
            ranks.push_back(worker);
        }
    }
    return ranks;
}

std::vector<KvCacheEvent> ApproxIndexer::dumpEvents() const {
    const TimePoint t = now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<SequenceHash, WorkerRef>> pairs;
    for (const auto& [hash, holders] : blocks_) {
        for (const auto& [worker, expiry] : holders) {
            if (t < expiry) {
                pairs.emplace_back(hash, worker);
            }
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
        events.push_back(event);
    }
    return events;
}

size_t ApproxIndexer::blockCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blocks_.size();
}

void ApproxIndexer::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    blocks_.clear();
    worker_blocks_.clear();
}

}  // namespace kvplane
