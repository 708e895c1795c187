#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "discovery/worker_ref.h"

namespace kvplane {

struct WorkerInfo {
    WorkerRef worker;
    RuntimeConfig runtime;
};

enum class WorkerEventKind { kAdded, kRemoved };

struct WorkerEvent {
    WorkerEventKind kind{WorkerEventKind::kAdded};
    WorkerRef worker;
    RuntimeConfig runtime;  // meaningful for kAdded only
};

/// Backing store of the live worker set (strongly consistent for liveness).
class DiscoveryClient {
public:
    using WatchCallback = std::function<void(const WorkerEvent&)>;

    virtual ~DiscoveryClient() = default;

    virtual std::vector<WorkerInfo> list() const = 0;

    /// Deliver every subsequent add/remove to `callback` until unwatch().
    virtual size_t watch(WatchCallback callback) = 0;
    virtual void unwatch(size_t watch_id) = 0;
};

/// Discovery backed by process memory. Used for statically configured pools
/// and by tests to drive membership changes.
class InMemoryDiscovery : public DiscoveryClient {
public:
    InMemoryDiscovery() = default;
    explicit InMemoryDiscovery(std::vector<WorkerInfo> initial);

    std::vector<WorkerInfo> list() const override;
    size_t watch(WatchCallback callback) override;
    void unwatch(size_t watch_id) override;

    void put(const WorkerInfo& info);
    void remove(const WorkerRef& worker);

private:
    void publish(const WorkerEvent& event);

    mutable std::mutex mutex_;
    std::vector<WorkerInfo> workers_;
    std::unordered_map<size_t, WatchCallback> watchers_;
    size_t next_watch_id_{1};
};

/// Parse a worker list: [{"worker_id":1,"dp_rank":0,"gpu_count":2,"engine":"vllm"}, ...]
/// Returns nullopt when the file is missing or malformed.
std::optional<std::vector<WorkerInfo>> loadWorkersFromJson(const std::string& path);

}  // namespace kvplane
