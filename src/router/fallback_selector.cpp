#include "router/fallback_selector.h"

#include <vector>

#include <spdlog/spdlog.h>

#include "discovery/worker_registry.h"

namespace kvplane {

std::optional<WorkerRef> FallbackSelector::select() {
    auto live = registry_.snapshot();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkerRef> healthy;
    healthy.reserve(live.size());
    for (const auto& worker : live) {
        if (failed_.count(worker) == 0) {
            healthy.push_back(worker);
        }
    }
    if (healthy.empty()) {
        spdlog::warn("No healthy worker available for fallback routing");
        return std::nullopt;
    }

    size_t index = next_index_ % healthy.size();
    next_index_ = index + 1;

    spdlog::debug("Fallback selected worker {} (round-robin)", to_string(healthy[index]));
    return healthy[index];
}

void FallbackSelector::markFailed(const WorkerRef& worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_.insert(worker);
    spdlog::warn("Worker {} marked as failed for fallback routing", to_string(worker));
}

void FallbackSelector::markHealthy(const WorkerRef& worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_.erase(worker) > 0) {
        spdlog::info("Worker {} marked as healthy for fallback routing", to_string(worker));
    }
}

bool FallbackSelector::isHealthy(const WorkerRef& worker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_.count(worker) == 0;
}

}  // namespace kvplane
