#pragma once

#include <mutex>
#include <optional>
#include <set>

#include "discovery/worker_ref.h"

namespace kvplane {

class WorkerRegistry;

/// Round-robin over the live worker set, skipping workers marked failed.
/// Used when the KV-aware decision is unavailable.
class FallbackSelector {
public:
    explicit FallbackSelector(const WorkerRegistry& registry) : registry_(registry) {}

    /// Returns nullopt if no healthy worker is registered.
    std::optional<WorkerRef> select();

    void markFailed(const WorkerRef& worker);
    void markHealthy(const WorkerRef& worker);
    bool isHealthy(const WorkerRef& worker) const;

private:
    const WorkerRegistry& registry_;
    mutable std::mutex mutex_;
    std::set<WorkerRef> failed_;
    size_t next_index_{0};
};

}  // namespace kvplane
