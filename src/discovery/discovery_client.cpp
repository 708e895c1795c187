#include "discovery/discovery_client.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kvplane {

InMemoryDiscovery::InMemoryDiscovery(std::vector<WorkerInfo> initial)
    : workers_(std::move(initial)) {}

std::vector<WorkerInfo> InMemoryDiscovery::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_;
}

size_t InMemoryDiscovery::watch(WatchCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = next_watch_id_++;
    watchers_.emplace(id, std::move(callback));
    return id;
}

void InMemoryDiscovery::unwatch(size_t watch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    watchers_.erase(watch_id);
}

void InMemoryDiscovery::put(const WorkerInfo& info) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&](const WorkerInfo& w) { return w.worker == info.worker; });
        if (it == workers_.end()) {
            workers_.push_back(info);
        } else {
            it->runtime = info.runtime;
        }
    }
    publish(WorkerEvent{WorkerEventKind::kAdded, info.worker, info.runtime});
}

void InMemoryDiscovery::remove(const WorkerRef& worker) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::remove_if(workers_.begin(), workers_.end(),
                                 [&](const WorkerInfo& w) { return w.worker == worker; });
        if (it == workers_.end()) {
            return;
        }
        workers_.erase(it, workers_.end());
    }
    publish(WorkerEvent{WorkerEventKind::kRemoved, worker, {}});
}

void InMemoryDiscovery::publish(const WorkerEvent& event) {
    std::vector<WatchCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(watchers_.size());
        for (const auto& [id, cb] : watchers_) {
            callbacks.push_back(cb);
        }
    }
    for (const auto& cb : callbacks) {
        cb(event);
    }
}

std::optional<std::vector<WorkerInfo>> loadWorkersFromJson(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Worker list not found: {}", path);
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        spdlog::warn("Failed to open worker list: {}", path);
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed worker list {}: {}", path, e.what());
        return std::nullopt;
    }

    const nlohmann::json* entries = &j;
    if (j.is_object() && j.contains("workers")) {
        entries = &j["workers"];
    }
    if (!entries->is_array()) {
        spdlog::warn("Worker list {} is not an array", path);
        return std::nullopt;
    }

    std::vector<WorkerInfo> workers;
    for (const auto& item : *entries) {
        if (!item.is_object() || !item.contains("worker_id") || !item["worker_id"].is_number_integer()) {
            spdlog::warn("Skipping worker entry without integer worker_id in {}", path);
            continue;
        }
        WorkerInfo info;
        info.worker.worker_id = item["worker_id"].get<WorkerId>();
        info.worker.dp_rank = item.value("dp_rank", 0u);
        info.runtime.gpu_count = std::max(1u, item.value("gpu_count", 1u));
        info.runtime.engine = parseEngineType(item.value("engine", std::string("unknown")));
        if (item.contains("max_num_batched_tokens") && item["max_num_batched_tokens"].is_number_unsigned()) {
            info.runtime.max_num_batched_tokens = item["max_num_batched_tokens"].get<uint64_t>();
        }
        if (item.contains("total_kv_blocks") && item["total_kv_blocks"].is_number_unsigned()) {
            info.runtime.total_kv_blocks = item["total_kv_blocks"].get<uint64_t>();
        }
        workers.push_back(info);
    }
    return workers;
}

}  // namespace kvplane
