#include "discovery/worker_ref.h"

#include <algorithm>
#include <cctype>

namespace kvplane {

std::string to_string(const WorkerRef& worker) {
    return std::to_string(worker.worker_id) + "/" + std::to_string(worker.dp_rank);
}

const char* to_string(EngineType type) {
    switch (type) {
        case EngineType::kVllm:
            return "vllm";
        case EngineType::kSglang:
            return "sglang";
        case EngineType::kTrtllm:
            return "trtllm";
        case EngineType::kUnknown:
            return "unknown";
    }
    return "unknown";
}

EngineType parseEngineType(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "vllm") return EngineType::kVllm;
    if (lower == "sglang") return EngineType::kSglang;
    if (lower == "trtllm" || lower == "tensorrt-llm") return EngineType::kTrtllm;
    return EngineType::kUnknown;
}

}  // namespace kvplane
