#include "router/kv_router.h"

#include <future>

#include <spdlog/spdlog.h>

#include "discovery/worker_registry.h"
#include "metrics/prometheus_exporter.h"
#include "router/router_error.h"
#include "utils/request_id.h"

namespace kvplane {

KvRouter::KvRouter(KvRouterConfig config, WorkerRegistry& registry, metrics::PrometheusExporter* exporter,
                   CancellationToken cancel)
    : config_(std::move(config))
    , registry_(registry)
    , exporter_(exporter)
    , cancel_(std::move(cancel))
    , indexer_(makeIndexer(config_.indexer, &registry))
    , scheduler_(std::make_unique<Scheduler>(config_.scheduler, registry))
    , fallback_(registry) {
    if (config_.scheduler_timeout.count() <= 0) {
        spdlog::warn("scheduler_timeout must be positive, using 50ms");
        config_.scheduler_timeout = std::chrono::milliseconds(50);
    }
    spdlog::info("KV router ready: block_size={} indexer={} temperature={} timeout={}ms",
                 scheduler_->config().block_size, to_string(indexer_->mode()), config_.scheduler.temperature,
                 config_.scheduler_timeout.count());
}

KvRouter::~KvRouter() {
    shutdown();
}

void KvRouter::throwIfCancelled() const {
    if (cancel_.isCancelled() || scheduler_->isShutdown()) {
        throw RouterError(RouterErrorCode::kCancelled, "router is shut down");
    }
}

RoutingDecision KvRouter::findBestMatch(RouteRequest request) {
    throwIfCancelled();
    if (request.request_id.empty()) {
        request.request_id = generate_request_id();
    }

    SchedulingRequest sreq;
    sreq.request_id = request.request_id;
    sreq.input_tokens = request.tokens.size();
    sreq.block_hashes = computeBlockHashes(request.tokens, scheduler_->config().block_size);
    sreq.config_override = request.config_override;
    sreq.update_states = request.update_states;

    if (request.pinned_worker) {
        if (!registry_.contains(*request.pinned_worker)) {
            throw RouterError(RouterErrorCode::kNoEligibleWorker,
                              "pinned worker " + to_string(*request.pinned_worker) + " is not registered");
        }
        sreq.candidates = {*request.pinned_worker};
    } else {
        sreq.candidates = std::move(request.candidates);
    }

    OverlapScores overlaps = indexer_->findMatches(sreq.block_hashes);
    sreq.overlaps = std::move(overlaps.scores);

    const size_t total_blocks = sreq.block_hashes.size();
    std::vector<SequenceHash> routed_hashes;
    if (indexer_->mode() == IndexerMode::kApproximate) {
        routed_hashes = sreq.block_hashes;
    }
    auto future = scheduler_->schedule(std::move(sreq));
    if (future.wait_for(config_.scheduler_timeout) != std::future_status::ready) {
        // The decision still lands later; release whatever it reserves.
        if (request.update_states) {
            scheduler_->free(request.request_id);
        }
        throw RouterError(RouterErrorCode::kSchedulerUnavailable,
                          "no decision within " + std::to_string(config_.scheduler_timeout.count()) + "ms");
    }
    SchedulingResult result = future.get();

    RoutingDecision decision;
    decision.request_id = request.request_id;
    decision.worker = result.worker;
    decision.overlap_blocks = result.overlap_blocks;
    decision.total_blocks = total_blocks;
    decision.score = result.score;
    decision.reserved = result.reserved;

    if (indexer_->mode() == IndexerMode::kApproximate) {
        indexer_->recordRouting(decision.worker, routed_hashes);
    }

    if (exporter_) {
        exporter_->inc_counter("kvplane_router_decisions_total", 1.0, "Routing decisions made");
        exporter_->inc_counter("kvplane_router_overlap_blocks_total", decision.overlap_blocks,
                               "Cached prefix blocks reused by routing decisions");
    }
    return decision;
}

RoutingDecision KvRouter::route(RouteRequest request) {
    if (request.request_id.empty()) {
        request.request_id = generate_request_id();
    }
    const std::string request_id = request.request_id;
    const size_t total_blocks = blocksForTokens(request.tokens.size(), scheduler_->config().block_size);
    try {
        return findBestMatch(std::move(request));
    } catch (const RouterError& e) {
        if (e.code() != RouterErrorCode::kNoEligibleWorker &&
            e.code() != RouterErrorCode::kSchedulerUnavailable) {
            throw;
        }
        spdlog::warn("KV-aware routing failed for {} ({}), falling back to round-robin", request_id, e.what());
    }

    auto worker = fallback_.select();
    if (!worker) {
        throw RouterError(RouterErrorCode::kNoEligibleWorker, "no worker registered for " + request_id);
    }

    if (exporter_) {
        exporter_->inc_counter("kvplane_router_decisions_total", 1.0, "Routing decisions made");
        exporter_->inc_counter("kvplane_router_fallbacks_total", 1.0, "Decisions made by the fallback policy");
    }

    RoutingDecision decision;
    decision.request_id = request_id;
    decision.worker = *worker;
    decision.total_blocks = total_blocks;
    decision.fallback = true;
    return decision;
}

void KvRouter::free(const std::string& request_id) {
    scheduler_->free(request_id);
}

void KvRouter::markPrefillComplete(const std::string& request_id) {
    scheduler_->markPrefillComplete(request_id);
}

std::vector<PotentialLoad> KvRouter::potentialLoads(const std::vector<Token>& tokens) {
    throwIfCancelled();
    auto hashes = computeBlockHashes(tokens, scheduler_->config().block_size);
    auto overlaps = indexer_->findMatches(hashes);
    auto future = scheduler_->potentialLoads(std::move(overlaps.scores), tokens.size());
    if (future.wait_for(config_.scheduler_timeout) != std::future_status::ready) {
        throw RouterError(RouterErrorCode::kSchedulerUnavailable, "potential load query timed out");
    }
    return future.get();
}

void KvRouter::publishLoadGauges() {
    if (!exporter_) return;
    throwIfCancelled();
    auto future = scheduler_->activeLoads();
    if (future.wait_for(config_.scheduler_timeout) != std::future_status::ready) {
        throw RouterError(RouterErrorCode::kSchedulerUnavailable, "active load query timed out");
    }
    auto loads = future.get();

    exporter_->clear("kvplane_router_active_decode_blocks");
    exporter_->clear("kvplane_router_active_prefill_tokens");
    for (const auto& worker : registry_.snapshot()) {
        WorkerLoad load;
        if (auto it = loads.find(worker); it != loads.end()) load = it->second;
        metrics::Labels labels{{"worker_id", std::to_string(worker.worker_id)},
                               {"dp_rank", std::to_string(worker.dp_rank)}};
        exporter_->set_gauge("kvplane_router_active_decode_blocks", labels,
                             static_cast<double>(load.decode_blocks), "Reserved decode blocks per worker");
        exporter_->set_gauge("kvplane_router_active_prefill_tokens", labels,
                             static_cast<double>(load.prefill_tokens), "In-flight prefill tokens per worker");
    }
}

RoutingLease KvRouter::acquireLease(const RoutingDecision& decision) {
    if (!decision.reserved) {
        return RoutingLease();
    }
    return RoutingLease(this, decision.request_id);
}

void KvRouter::applyKvEvent(const KvCacheEvent& event) {
    indexer_->applyEvent(event);
}

void KvRouter::markWorkerFailed(const WorkerRef& worker) {
    fallback_.markFailed(worker);
}

void KvRouter::markWorkerHealthy(const WorkerRef& worker) {
    fallback_.markHealthy(worker);
}

void KvRouter::resetState() {
    indexer_->clear();
    scheduler_->reset();
    spdlog::info("KV router state reset");
}

void KvRouter::shutdown() {
    if (scheduler_->isShutdown()) {
        return;
    }
    scheduler_->shutdown();
    spdlog::info("KV router shut down");
}

bool KvRouter::isShutdown() const {
    return scheduler_->isShutdown();
}

void RoutingLease::markPrefillComplete() {
    if (router_) {
        router_->markPrefillComplete(request_id_);
    }
}

void RoutingLease::release() {
    if (router_) {
        router_->free(request_id_);
        router_ = nullptr;
    }
}

}  // namespace kvplane
