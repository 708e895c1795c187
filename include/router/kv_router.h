#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "discovery/worker_ref.h"
#include "kv/kv_event.h"
#include "kv/kv_indexer.h"
#include "router/fallback_selector.h"
#include "router/routing_lease.h"
#include "router/scheduler.h"
#include "runtime/cancellation.h"

namespace kvplane {

class WorkerRegistry;

namespace metrics {
class PrometheusExporter;
}

struct KvRouterConfig {
    SchedulerConfig scheduler;
    IndexerConfig indexer;
    std::chrono::milliseconds scheduler_timeout{50};
};

struct RouteRequest {
    /// Generated when empty.
    std::string request_id;
    std::vector<Token> tokens;
    std::optional<RouterConfigOverride> config_override;
    /// Skip scoring and send the request here (must be registered).
    std::optional<WorkerRef> pinned_worker;
    std::vector<WorkerRef> candidates;
    bool update_states{true};
};

struct RoutingDecision {
    std::string request_id;
    WorkerRef worker;
    uint32_t overlap_blocks{0};
    size_t total_blocks{0};
    double score{0.0};
    bool fallback{false};
    bool reserved{false};
};

/// KV-cache-aware request router.
///
/// Owns the sequence indexer and the scheduler. Routing calls may come from
/// any thread; each waits at most `scheduler_timeout` for the decision loop.
class KvRouter {
public:
    KvRouter(KvRouterConfig config, WorkerRegistry& registry,
             metrics::PrometheusExporter* exporter = nullptr,
             CancellationToken cancel = CancellationToken());
    ~KvRouter();

    KvRouter(const KvRouter&) = delete;
    KvRouter& operator=(const KvRouter&) = delete;

    /// Throws RouterError (kNoEligibleWorker, kSchedulerUnavailable, kCancelled).
    RoutingDecision findBestMatch(RouteRequest request);

    /// findBestMatch, falling back to round-robin when no KV-aware decision is
    /// available. Throws only when no worker is registered or after shutdown.
    RoutingDecision route(RouteRequest request);

    void free(const std::string& request_id);
    void markPrefillComplete(const std::string& request_id);

    std::vector<PotentialLoad> potentialLoads(const std::vector<Token>& tokens);

    /// Refresh the per-worker kvplane_router_active_* gauges from the
    /// scheduler's load state. No-op without an exporter.
    void publishLoadGauges();

    /// Ties the reservation of `decision` to the returned lease's lifetime.
    /// The lease must not outlive this router.
    RoutingLease acquireLease(const RoutingDecision& decision);

    void applyKvEvent(const KvCacheEvent& event);

    /// Report a worker that failed to serve a routed request; the fallback
    /// policy skips it until markWorkerHealthy().
    void markWorkerFailed(const WorkerRef& worker);
    void markWorkerHealthy(const WorkerRef& worker);

    void resetState();
    void shutdown();
    bool isShutdown() const;

    KvIndexer& indexer() { return *indexer_; }
    const KvRouterConfig& config() const { return config_; }

#ifdef KVPLANE_TESTING
    Scheduler& schedulerForTest() { return *scheduler_; }
#endif

private:
    void throwIfCancelled() const;

    KvRouterConfig config_;
    WorkerRegistry& registry_;
    metrics::PrometheusExporter* exporter_;
    CancellationToken cancel_;

    std::unique_ptr<KvIndexer> indexer_;
    std::unique_ptr<Scheduler> scheduler_;
    FallbackSelector fallback_;
};

}  // namespace kvplane
