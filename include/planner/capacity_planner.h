#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "planner/load_predictor.h"
#include "planner/throughput_table.h"

namespace kvplane {

enum class ReplicaRole {
    kPrefill,
    kDecode,
};

const char* to_string(ReplicaRole role);

struct ReplicaTarget {
    ReplicaRole role;
    uint32_t desired_count{0};
};

struct PlannerInputs {
    LoadForecast forecast;
    double interval_s{180.0};
    double prefill_correction{1.0};
    double decode_correction{1.0};
    double itl_sla_ms{50.0};
    uint32_t gpus_per_prefill_replica{1};
    uint32_t gpus_per_decode_replica{1};
    /// Total GPUs available to both roles. 0 means unbounded.
    uint32_t gpu_budget{0};
    uint32_t min_replicas{1};
};

struct ReplicaPlan {
    uint32_t prefill_replicas{0};
    uint32_t decode_replicas{0};
    /// Counts before the GPU budget was applied.
    uint32_t unclamped_prefill{0};
    uint32_t unclamped_decode{0};
    double prefill_throughput_required{0.0};
    double decode_throughput_required{0.0};
    bool capacity_infeasible{false};

    uint32_t gpuCount(const PlannerInputs& inputs) const {
        return prefill_replicas * inputs.gpus_per_prefill_replica + decode_replicas * inputs.gpus_per_decode_replica;
    }
    std::vector<ReplicaTarget> targets() const {
        return {ReplicaTarget{ReplicaRole::kPrefill, prefill_replicas},
                ReplicaTarget{ReplicaRole::kDecode, decode_replicas}};
    }
};

/// Replica counts that meet the forecast within the SLA. Pure.
ReplicaPlan computeReplicaPlan(const PlannerInputs& inputs, const ThroughputProfile& profile);

/// Exponentially weighted observed/target ratio for one role.
class CorrectionTracker {
public:
    explicit CorrectionTracker(double alpha = 0.5);

    /// Fold in one interval. Non-finite or non-positive inputs are ignored.
    double update(double observed, double target);

    double value() const { return value_; }
    void reset() { value_ = 1.0; }

private:
    double alpha_;
    double value_{1.0};
};

}  // namespace kvplane
