#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>

namespace kvplane {

using WorkerId = int64_t;

/// A routable unit: one worker process, optionally one data-parallel rank of it.
struct WorkerRef {
    WorkerId worker_id{0};
    uint32_t dp_rank{0};

    bool operator==(const WorkerRef& other) const {
        return worker_id == other.worker_id && dp_rank == other.dp_rank;
    }
    bool operator!=(const WorkerRef& other) const { return !(*this == other); }

    // (worker_id, dp_rank) ordering is the deterministic tie-break order.
    bool operator<(const WorkerRef& other) const {
        return std::tie(worker_id, dp_rank) < std::tie(other.worker_id, other.dp_rank);
    }
};

std::string to_string(const WorkerRef& worker);

enum class EngineType {
    kUnknown,
    kVllm,
    kSglang,
    kTrtllm,
};

const char* to_string(EngineType type);
EngineType parseEngineType(const std::string& text);

/// Per-worker runtime facts used to normalize load and throughput.
struct RuntimeConfig {
    uint32_t gpu_count{1};
    EngineType engine{EngineType::kUnknown};
    std::optional<uint64_t> max_num_batched_tokens;
    std::optional<uint64_t> total_kv_blocks;
};

}  // namespace kvplane

namespace std {
template <>
struct hash<kvplane::WorkerRef> {
    size_t operator()(const kvplane::WorkerRef& w) const noexcept {
        size_t h = std::hash<int64_t>{}(w.worker_id);
        return h ^ (std::hash<uint32_t>{}(w.dp_rank) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
}  // namespace std
