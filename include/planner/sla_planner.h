#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "planner/capacity_planner.h"
#include "planner/load_predictor.h"
#include "planner/metrics_collector.h"
#include "planner/scaling_connector.h"
#include "planner/throughput_table.h"
#include "runtime/cancellation.h"

namespace kvplane {

namespace metrics {
class PrometheusExporter;
}

struct SlaPlannerConfig {
    std::chrono::seconds adjustment_interval{180};
    double ttft_sla_ms{500.0};
    double itl_sla_ms{50.0};
    uint32_t gpu_budget{8};
    uint32_t min_replicas{1};
    uint32_t prefill_gpus_per_replica{1};
    uint32_t decode_gpus_per_replica{1};
    std::string predictor{"constant"};
    PredictorOptions predictor_options;
    double correction_alpha{0.5};
    /// Compute and publish plans without touching the connector.
    bool dry_run{false};
};

enum class CycleOutcome {
    kApplied,
    kDryRun,
    kSkippedNotConverged,
    kSkippedNoData,
    kFailed,
};

const char* to_string(CycleOutcome outcome);

struct CycleResult {
    CycleOutcome outcome{CycleOutcome::kSkippedNoData};
    std::optional<MetricsSample> sample;
    LoadForecast forecast;
    std::optional<ReplicaPlan> plan;
};

/// Periodic SLA-driven capacity loop.
class SlaPlanner {
public:
    SlaPlanner(SlaPlannerConfig config, MetricsCollector& collector, ThroughputProfile profile,
               ScalingConnector& connector, metrics::PrometheusExporter* exporter = nullptr,
               CancellationToken cancel = CancellationToken());
    ~SlaPlanner();

    SlaPlanner(const SlaPlanner&) = delete;
    SlaPlanner& operator=(const SlaPlanner&) = delete;

    /// One adjustment step. Never throws.
    CycleResult runCycle(WallClock::time_point now = WallClock::now());

    /// Run cycles every adjustment_interval on a background thread until stop()
    /// or the cancellation token fires.
    void start();
    void stop();
    bool running() const;

    double prefillCorrection() const;
    double decodeCorrection() const;
    const SlaPlannerConfig& config() const { return config_; }

private:
    CycleResult runCycleImpl(WallClock::time_point now);
    void loop();

    SlaPlannerConfig config_;
    MetricsCollector& collector_;
    ThroughputProfile profile_;
    ScalingConnector& connector_;
    metrics::PrometheusExporter* exporter_;
    CancellationToken cancel_;
    std::unique_ptr<LoadPredictor> predictor_;

    mutable std::mutex mutex_;
    CorrectionTracker prefill_correction_;
    CorrectionTracker decode_correction_;

    CancellationToken loop_stop_;
    std::thread thread_;
};

}  // namespace kvplane
