#include "discovery/worker_registry.h"

#include <spdlog/spdlog.h>

namespace kvplane {

WorkerRegistry::~WorkerRegistry() {
    detach();
}

void WorkerRegistry::attach(DiscoveryClient& discovery) {
    detach();
    discovery_ = &discovery;
    // Watch first so nothing published between list() and watch() is lost;
    // addWorker/removeWorker are idempotent so overlap is harmless.
    watch_id_ = discovery.watch([this](const WorkerEvent& event) {
        if (event.kind == WorkerEventKind::kAdded) {
            addWorker(event.worker, event.runtime);
        } else {
            removeWorker(event.worker);
        }
    });
    for (const auto& info : discovery.list()) {
        addWorker(info.worker, info.runtime);
    }
    spdlog::info("Worker registry attached to discovery ({} workers)", size());
}

void WorkerRegistry::detach() {
    if (discovery_ != nullptr) {
        discovery_->unwatch(watch_id_);
        discovery_ = nullptr;
        watch_id_ = 0;
    }
}

bool WorkerRegistry::addWorker(const WorkerRef& worker, const RuntimeConfig& runtime) {
    std::lock_guard<std::mutex> event_lock(event_mutex_);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = workers_.insert_or_assign(worker, runtime);
        (void)it;
        if (!inserted) {
            return false;
        }
    }
    spdlog::info("Worker {} registered (gpus={}, engine={})", to_string(worker),
                 runtime.gpu_count, to_string(runtime.engine));
    notify(WorkerEvent{WorkerEventKind::kAdded, worker, runtime});
    return true;
}

bool WorkerRegistry::removeWorker(const WorkerRef& worker) {
    std::lock_guard<std::mutex> event_lock(event_mutex_);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (workers_.erase(worker) == 0) {
            return false;
        }
    }
    spdlog::info("Worker {} removed", to_string(worker));
    notify(WorkerEvent{WorkerEventKind::kRemoved, worker, {}});
    return true;
}

size_t WorkerRegistry::removeWorkerId(WorkerId worker_id) {
    std::vector<WorkerRef> matching;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [worker, runtime] : workers_) {
            if (worker.worker_id == worker_id) {
                matching.push_back(worker);
            }
        }
    }
    size_t removed = 0;
    for (const auto& worker : matching) {
        if (removeWorker(worker)) {
            ++removed;
        }
    }
    return removed;
}

std::set<WorkerRef> WorkerRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::set<WorkerRef> out;
    for (const auto& [worker, runtime] : workers_) {
        out.insert(worker);
    }
    return out;
}

bool WorkerRegistry::contains(const WorkerRef& worker) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return workers_.count(worker) > 0;
}

bool WorkerRegistry::containsWorkerId(WorkerId worker_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = workers_.lower_bound(WorkerRef{worker_id, 0});
    return it != workers_.end() && it->first.worker_id == worker_id;
}

size_t WorkerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return workers_.size();
}

std::optional<RuntimeConfig> WorkerRegistry::runtimeConfig(const WorkerRef& worker) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = workers_.find(worker);
    if (it == workers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t WorkerRegistry::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    size_t id = next_subscription_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void WorkerRegistry::unsubscribe(size_t subscription_id) {
    // Waits out an in-flight notification; must not be called from a listener.
    std::lock_guard<std::mutex> event_lock(event_mutex_);
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(subscription_id);
}

void WorkerRegistry::notify(const WorkerEvent& event) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Worker registry listener failed for {}: {}", to_string(event.worker), e.what());
        }
    }
}

}  // namespace kvplane
