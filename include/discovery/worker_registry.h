#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <vector>

#include "discovery/discovery_client.h"

namespace kvplane {

/// Authoritative live worker set.
///
/// Listeners run synchronously on the mutating thread, after the set has been
/// updated and before addWorker/removeWorker return. Events are delivered in
/// the order the registry applied them.
class WorkerRegistry {
public:
    using Listener = std::function<void(const WorkerEvent&)>;

    WorkerRegistry() = default;
    ~WorkerRegistry();

    WorkerRegistry(const WorkerRegistry&) = delete;
    WorkerRegistry& operator=(const WorkerRegistry&) = delete;

    /// Seed from discovery.list() and follow discovery.watch() until detach().
    void attach(DiscoveryClient& discovery);
    void detach();

    /// Idempotent. Re-adding a known worker only updates its runtime config.
    /// Returns true when the worker was newly added.
    bool addWorker(const WorkerRef& worker, const RuntimeConfig& runtime = {});

    /// Returns true when the worker was present.
    bool removeWorker(const WorkerRef& worker);

    /// Remove every dp rank of a worker id. Returns the number removed.
    size_t removeWorkerId(WorkerId worker_id);

    std::set<WorkerRef> snapshot() const;
    bool contains(const WorkerRef& worker) const;
    bool containsWorkerId(WorkerId worker_id) const;
    size_t size() const;
    std::optional<RuntimeConfig> runtimeConfig(const WorkerRef& worker) const;

    size_t subscribe(Listener listener);
    void unsubscribe(size_t subscription_id);

private:
    void notify(const WorkerEvent& event);

    // Serializes membership changes together with their listener fan-out.
    std::mutex event_mutex_;

    mutable std::shared_mutex mutex_;
    std::map<WorkerRef, RuntimeConfig> workers_;

    std::mutex listener_mutex_;
    std::map<size_t, Listener> listeners_;  // invoked in subscription order
    size_t next_subscription_id_{1};

    DiscoveryClient* discovery_{nullptr};
    size_t watch_id_{0};
};

}  // namespace kvplane
