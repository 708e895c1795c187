#include "router/active_load.h"

#include <spdlog/spdlog.h>

namespace kvplane {

namespace {

uint64_t saturatingSub(uint64_t value, uint64_t delta) {
    return delta > value ? 0 : value - delta;
}

}  // namespace

bool ActiveLoadTracker::reserve(const std::string& request_id, const WorkerRef& worker,
                                uint64_t decode_blocks, uint64_t prefill_tokens) {
    if (requests_.count(request_id) > 0) {
        spdlog::warn("Request {} already holds a reservation; ignoring duplicate", request_id);
        return false;
    }
    requests_.emplace(request_id, Reservation{worker, decode_blocks, prefill_tokens, false});
    auto& load = loads_[worker];
    load.decode_blocks += decode_blocks;
    load.prefill_tokens += prefill_tokens;
    return true;
}

void ActiveLoadTracker::release(const WorkerRef& worker, uint64_t decode_blocks, uint64_t prefill_tokens) {
    auto it = loads_.find(worker);
    if (it == loads_.end()) {
        return;
    }
    it->second.decode_blocks = saturatingSub(it->second.decode_blocks, decode_blocks);
    it->second.prefill_tokens = saturatingSub(it->second.prefill_tokens, prefill_tokens);
    if (it->second.decode_blocks == 0 && it->second.prefill_tokens == 0) {
        loads_.erase(it);
    }
}

bool ActiveLoadTracker::markPrefillComplete(const std::string& request_id) {
    auto it = requests_.find(request_id);
    if (it == requests_.end() || it->second.prefill_done) {
        return false;
    }
    release(it->second.worker, 0, it->second.prefill_tokens);
    it->second.prefill_done = true;
    return true;
}

bool ActiveLoadTracker::free(const std::string& request_id) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return false;
    }
    const auto& r = it->second;
    release(r.worker, r.decode_blocks, r.prefill_done ? 0 : r.prefill_tokens);
    requests_.erase(it);
    return true;
}

size_t ActiveLoadTracker::removeWorker(const WorkerRef& worker) {
    size_t dropped = 0;
    for (auto it = requests_.begin(); it != requests_.end();) {
        if (it->second.worker == worker) {
            it = requests_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    loads_.erase(worker);
    return dropped;
}

WorkerLoad ActiveLoadTracker::load(const WorkerRef& worker) const {
    auto it = loads_.find(worker);
    return it == loads_.end() ? WorkerLoad{} : it->second;
}

std::map<WorkerRef, WorkerLoad> ActiveLoadTracker::snapshot() const {
    return std::map<WorkerRef, WorkerLoad>(loads_.begin(), loads_.end());
}

std::optional<WorkerRef> ActiveLoadTracker::workerFor(const std::string& request_id) const {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second.worker;
}

void ActiveLoadTracker::clear() {
    requests_.clear();
    loads_.clear();
}

}  // namespace kvplane
