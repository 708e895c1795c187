#include "planner/sla_planner.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "metrics/prometheus_exporter.h"

namespace kvplane {

const char* to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::kApplied:
            return "applied";
        case CycleOutcome::kDryRun:
            return "dry_run";
        case CycleOutcome::kSkippedNotConverged:
            return "skipped_not_converged";
        case CycleOutcome::kSkippedNoData:
            return "skipped_no_data";
        case CycleOutcome::kFailed:
            return "failed";
    }
    return "unknown";
}

SlaPlanner::SlaPlanner(SlaPlannerConfig config, MetricsCollector& collector, ThroughputProfile profile,
                       ScalingConnector& connector, metrics::PrometheusExporter* exporter, CancellationToken cancel)
    : config_(std::move(config))
    , collector_(collector)
    , profile_(std::move(profile))
    , connector_(connector)
    , exporter_(exporter)
    , cancel_(std::move(cancel))
    , predictor_(makeLoadPredictor(config_.predictor, config_.predictor_options))
    , prefill_correction_(config_.correction_alpha)
    , decode_correction_(config_.correction_alpha) {
    spdlog::info("SLA planner: interval={}s ttft={}ms itl={}ms gpu_budget={} predictor={} connector={}{}",
                 config_.adjustment_interval.count(), config_.ttft_sla_ms, config_.itl_sla_ms, config_.gpu_budget,
                 predictor_->name(), connector_.name(), config_.dry_run ? " (dry-run)" : "");
}

SlaPlanner::~SlaPlanner() {
    stop();
}

double SlaPlanner::prefillCorrection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prefill_correction_.value();
}

double SlaPlanner::decodeCorrection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decode_correction_.value();
}

CycleResult SlaPlanner::runCycle(WallClock::time_point now) {
    try {
        return runCycleImpl(now);
    } catch (const std::exception& e) {
        spdlog::error("Planner cycle failed: {}", e.what());
        CycleResult result;
        result.outcome = CycleOutcome::kFailed;
        return result;
    }
}

CycleResult SlaPlanner::runCycleImpl(WallClock::time_point now) {
    CycleResult result;

    // 1. Observe.
    result.sample = collector_.collect(now);

    // 2. Corrections from how the last interval actually behaved.
    double prefill_correction = 1.0;
    double decode_correction = 1.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.sample) {
            prefill_correction_.update(result.sample->ttft_ms, config_.ttft_sla_ms);
            decode_correction_.update(result.sample->itl_ms, config_.itl_sla_ms);
        }
        prefill_correction = prefill_correction_.value();
        decode_correction = decode_correction_.value();
    }
    if (exporter_) {
        exporter_->set_gauge("kvplane_planner_prefill_correction", prefill_correction,
                             "Prefill correction factor (observed/target TTFT)");
        exporter_->set_gauge("kvplane_planner_decode_correction", decode_correction,
                             "Decode correction factor (observed/target ITL)");
    }

    // 3. Wait for the previous change to settle. Targets that ran out of
    // retries last interval go out again now.
    if (!config_.dry_run) {
        connector_.resubmitFailed();
    }
    if (!config_.dry_run && !connector_.isConverged()) {
        spdlog::info("Deployment not converged yet, skipping adjustment");
        result.outcome = CycleOutcome::kSkippedNotConverged;
        if (exporter_) {
            exporter_->inc_counter("kvplane_planner_cycles_skipped_total", 1.0, "Planner cycles skipped");
        }
        return result;
    }

    const auto window = collector_.window();
    if (window.empty()) {
        spdlog::info("No traffic observed yet, skipping adjustment");
        result.outcome = CycleOutcome::kSkippedNoData;
        if (exporter_) {
            exporter_->inc_counter("kvplane_planner_cycles_skipped_total", 1.0, "Planner cycles skipped");
        }
        return result;
    }

    // 4. Forecast and plan.
    result.forecast = predictor_->fitPredict(window);

    PlannerInputs inputs;
    inputs.forecast = result.forecast;
    inputs.interval_s = static_cast<double>(config_.adjustment_interval.count());
    inputs.prefill_correction = prefill_correction;
    inputs.decode_correction = decode_correction;
    inputs.itl_sla_ms = config_.itl_sla_ms;
    inputs.gpus_per_prefill_replica = config_.prefill_gpus_per_replica;
    inputs.gpus_per_decode_replica = config_.decode_gpus_per_replica;
    inputs.gpu_budget = config_.gpu_budget;
    inputs.min_replicas = config_.min_replicas;
    ReplicaPlan plan = computeReplicaPlan(inputs, profile_);
    result.plan = plan;

    spdlog::info("Forecast requests={:.1f} isl={:.1f} osl={:.1f} -> prefill={} decode={}{}",
                 result.forecast.request_count, result.forecast.input_len, result.forecast.output_len,
                 plan.prefill_replicas, plan.decode_replicas, plan.capacity_infeasible ? " (budget-limited)" : "");

    if (exporter_) {
        exporter_->set_gauge("kvplane_planner_prefill_replicas", plan.prefill_replicas, "Planned prefill replicas");
        exporter_->set_gauge("kvplane_planner_decode_replicas", plan.decode_replicas, "Planned decode replicas");
    }

    // 5. Apply.
    if (config_.dry_run) {
        result.outcome = CycleOutcome::kDryRun;
        return result;
    }
    connector_.setTargets(plan.targets());
    result.outcome = CycleOutcome::kApplied;
    return result;
}

void SlaPlanner::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    loop_stop_ = CancellationToken();
    thread_ = std::thread(&SlaPlanner::loop, this);
}

void SlaPlanner::stop() {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        loop_stop_.cancel();
        thread = std::move(thread_);
    }
    thread.join();
    spdlog::info("SLA planner stopped");
}

bool SlaPlanner::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable();
}

void SlaPlanner::loop() {
    CancellationToken stop_token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_token = loop_stop_;
    }
    while (!cancel_.isCancelled() && !stop_token.isCancelled()) {
        // Wake up at least once a second to notice the external token.
        const auto deadline = std::chrono::steady_clock::now() + config_.adjustment_interval;
        for (auto now = std::chrono::steady_clock::now(); now < deadline; now = std::chrono::steady_clock::now()) {
            auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::seconds(1));
            if (stop_token.waitFor(slice) || cancel_.isCancelled()) {
                return;
            }
        }
        auto result = runCycle();
        spdlog::debug("Planner cycle outcome: {}", to_string(result.outcome));
    }
}

}  // namespace kvplane
