#include "kv/kv_indexer.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "discovery/worker_registry.h"
#include "kv/approx_indexer.h"
#include "kv/exact_indexer.h"

namespace kvplane {

const char* to_string(IndexerMode mode) {
    switch (mode) {
        case IndexerMode::kExact:
            return "exact";
        case IndexerMode::kApproximate:
            return "approximate";
        case IndexerMode::kDisabled:
            return "disabled";
    }
    return "unknown";
}

IndexerMode parseIndexerMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "approximate" || lower == "approx") return IndexerMode::kApproximate;
    if (lower == "disabled" || lower == "off" || lower == "none") return IndexerMode::kDisabled;
    if (lower != "exact") {
        spdlog::warn("Unknown indexer mode '{}', using exact", text);
    }
    return IndexerMode::kExact;
}

void KvIndexer::removeWorker(WorkerId worker_id) {
    for (const auto& worker : knownRanks(worker_id)) {
        removeWorkerRank(worker);
    }
}

void KvIndexer::recordRouting(const WorkerRef&, const std::vector<SequenceHash>&) {}

bool KvIndexer::isRegistered(const WorkerRef& worker) const {
    return registry_ == nullptr || registry_->contains(worker);
}

void KvIndexer::watchRegistry() {
    if (registry_ == nullptr) {
        return;
    }
    subscription_id_ = registry_->subscribe([this](const WorkerEvent& event) {
        if (event.kind == WorkerEventKind::kRemoved) {
            removeWorkerRank(event.worker);
        }
    });
}

void KvIndexer::unwatchRegistry() {
    if (registry_ != nullptr && subscription_id_ != 0) {
        registry_->unsubscribe(subscription_id_);
        subscription_id_ = 0;
    }
}

std::unique_ptr<KvIndexer> makeIndexer(const IndexerConfig& config, WorkerRegistry* registry) {
    spdlog::info("Creating {} KV indexer", to_string(config.mode));
    switch (config.mode) {
        case IndexerMode::kExact:
            return std::make_unique<ExactIndexer>(registry);
        case IndexerMode::kApproximate:
            return std::make_unique<ApproxIndexer>(registry, config.ttl);
        case IndexerMode::kDisabled:
            return std::make_unique<DisabledIndexer>(registry);
    }
    return std::make_unique<ExactIndexer>(registry);
}

}  // namespace kvplane
