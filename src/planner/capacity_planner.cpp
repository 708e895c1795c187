#include "planner/capacity_planner.h"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace kvplane {

namespace {

constexpr double kMinRatio = 0.1;
constexpr double kMaxRatio = 10.0;

uint32_t replicasFor(double required, double capacity_per_replica, const char* role) {
    if (required <= 0.0) {
        return 0;
    }
    if (!std::isfinite(capacity_per_replica) || capacity_per_replica <= 0.0) {
        spdlog::warn("No usable {} throughput in profile; holding at the minimum", role);
        return 0;
    }
    return static_cast<uint32_t>(std::ceil(required / capacity_per_replica));
}

}  // namespace

const char* to_string(ReplicaRole role) {
    switch (role) {
        case ReplicaRole::kPrefill:
            return "prefill";
        case ReplicaRole::kDecode:
            return "decode";
    }
    return "unknown";
}

ReplicaPlan computeReplicaPlan(const PlannerInputs& inputs, const ThroughputProfile& profile) {
    ReplicaPlan plan;
    const double interval_s = inputs.interval_s > 0.0 ? inputs.interval_s : 1.0;
    const uint32_t gp = std::max<uint32_t>(inputs.gpus_per_prefill_replica, 1);
    const uint32_t gd = std::max<uint32_t>(inputs.gpus_per_decode_replica, 1);
    const auto& f = inputs.forecast;

    // Prefill.
    plan.prefill_throughput_required = f.request_count * f.input_len / interval_s * inputs.prefill_correction;
    const double prefill_per_gpu = profile.prefill.throughputPerGpu(f.input_len);
    plan.unclamped_prefill = replicasFor(plan.prefill_throughput_required, prefill_per_gpu * gp, "prefill");

    // Decode.
    const double decode_correction = inputs.decode_correction > 0.0 ? inputs.decode_correction : 1.0;
    const double corrected_itl = inputs.itl_sla_ms / decode_correction;
    const double context_len = f.input_len + f.output_len / 2.0;
    const double decode_per_gpu = profile.decode.throughputPerGpu(corrected_itl, context_len);
    plan.decode_throughput_required = f.request_count * f.output_len / interval_s;
    plan.unclamped_decode = replicasFor(plan.decode_throughput_required, decode_per_gpu * gd, "decode");

    uint32_t prefill = std::max(plan.unclamped_prefill, inputs.min_replicas);
    uint32_t decode = std::max(plan.unclamped_decode, inputs.min_replicas);

    const uint64_t budget = inputs.gpu_budget;
    const uint64_t demand = uint64_t{prefill} * gp + uint64_t{decode} * gd;
    if (budget > 0 && demand > budget) {
        plan.capacity_infeasible = true;
        const double scale = static_cast<double>(budget) / static_cast<double>(demand);
        const double exact_prefill = prefill * scale;
        const double exact_decode = decode * scale;

        uint32_t scaled_prefill = std::max(static_cast<uint32_t>(std::floor(exact_prefill)), inputs.min_replicas);
        uint32_t scaled_decode = std::max(static_cast<uint32_t>(std::floor(exact_decode)), inputs.min_replicas);

        // Largest remainder first; only hand out GPUs that are left.
        int64_t remaining = static_cast<int64_t>(budget) -
                            static_cast<int64_t>(uint64_t{scaled_prefill} * gp + uint64_t{scaled_decode} * gd);
        struct Share {
            double remainder;
            uint32_t* count;
            uint32_t gpus;
            uint32_t cap;
        };
        Share shares[] = {
            {exact_prefill - std::floor(exact_prefill), &scaled_prefill, gp, prefill},
            {exact_decode - std::floor(exact_decode), &scaled_decode, gd, decode},
        };
        std::stable_sort(std::begin(shares), std::end(shares),
                         [](const Share& a, const Share& b) { return a.remainder > b.remainder; });
        for (auto& share : shares) {
            if (share.remainder > 0.0 && *share.count < share.cap && remaining >= share.gpus) {
                ++*share.count;
                remaining -= share.gpus;
            }
        }

        // Raising a role to min_replicas can push the total back over budget;
        // take the excess from whichever role sits furthest above its minimum.
        uint64_t used = uint64_t{scaled_prefill} * gp + uint64_t{scaled_decode} * gd;
        const uint64_t floor_gpus = uint64_t{inputs.min_replicas} * gp + uint64_t{inputs.min_replicas} * gd;
        while (used > budget) {
            const uint64_t prefill_slack =
                scaled_prefill > inputs.min_replicas ? uint64_t{scaled_prefill - inputs.min_replicas} * gp : 0;
            const uint64_t decode_slack =
                scaled_decode > inputs.min_replicas ? uint64_t{scaled_decode - inputs.min_replicas} * gd : 0;
            if (prefill_slack == 0 && decode_slack == 0) {
                break;
            }
            if (prefill_slack >= decode_slack) {
                --scaled_prefill;
                used -= gp;
            } else {
                --scaled_decode;
                used -= gd;
            }
        }
        if (floor_gpus > budget) {
            spdlog::warn("min_replicas={} alone needs {} GPUs, above the budget of {}", inputs.min_replicas,
                         floor_gpus, budget);
        }

        spdlog::warn("Capacity infeasible: need prefill={} decode={} ({} GPUs) but budget is {}; scaled to "
                     "prefill={} decode={}",
                     prefill, decode, demand, budget, scaled_prefill, scaled_decode);
        prefill = scaled_prefill;
        decode = scaled_decode;
    }

    plan.prefill_replicas = prefill;
    plan.decode_replicas = decode;
    spdlog::debug("Replica plan: prefill={} ({:.1f} tok/s) decode={} ({:.1f} tok/s)", plan.prefill_replicas,
                  plan.prefill_throughput_required, plan.decode_replicas, plan.decode_throughput_required);
    return plan;
}

CorrectionTracker::CorrectionTracker(double alpha) : alpha_(alpha) {
    if (!(alpha_ > 0.0 && alpha_ <= 1.0)) {
        spdlog::warn("Correction alpha {} out of range (0, 1], using 0.5", alpha);
        alpha_ = 0.5;
    }
}

double CorrectionTracker::update(double observed, double target) {
    if (!std::isfinite(observed) || !std::isfinite(target) || observed <= 0.0 || target <= 0.0) {
        return value_;
    }
    const double ratio = std::clamp(observed / target, kMinRatio, kMaxRatio);
    value_ = alpha_ * ratio + (1.0 - alpha_) * value_;
    return value_;
}

}  // namespace kvplane
