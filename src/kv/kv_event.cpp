#include "kv/kv_event.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kvplane {

const char* to_string(KvEventAction action) {
    switch (action) {
        case KvEventAction::kAdded:
            return "added";
        case KvEventAction::kRemoved:
            return "removed";
        case KvEventAction::kCleared:
            return "cleared";
    }
    return "unknown";
}

namespace {

std::optional<KvEventAction> parseAction(const std::string& text) {
    if (text == "added" || text == "stored") return KvEventAction::kAdded;
    if (text == "removed") return KvEventAction::kRemoved;
    if (text == "cleared") return KvEventAction::kCleared;
    return std::nullopt;
}

}  // namespace

std::optional<KvCacheEvent> parseKvEvent(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Dropping malformed KV event: {}", e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        spdlog::warn("Dropping KV event that is not a JSON object");
        return std::nullopt;
    }
    if (!j.contains("worker_id") || !j["worker_id"].is_number_integer()) {
        spdlog::warn("Dropping KV event without integer worker_id");
        return std::nullopt;
    }
    if (!j.contains("action") || !j["action"].is_string()) {
        spdlog::warn("Dropping KV event without action");
        return std::nullopt;
    }
    auto action = parseAction(j["action"].get<std::string>());
    if (!action) {
        spdlog::warn("Dropping KV event with unknown action '{}'", j["action"].get<std::string>());
        return std::nullopt;
    }

    KvCacheEvent event;
    event.action = *action;
    event.worker.worker_id = j["worker_id"].get<WorkerId>();
    event.worker.dp_rank = j.value("dp_rank", 0u);
    event.event_id = j.value("event_id", uint64_t{0});
    event.timestamp_ms = j.value("timestamp", int64_t{0});

    if (event.action != KvEventAction::kCleared) {
        if (!j.contains("block_hash") || !j["block_hash"].is_number()) {
            spdlog::warn("Dropping {} KV event without block_hash", to_string(event.action));
            return std::nullopt;
        }
        // Producers that only have signed 64-bit integers send the same bits.
        if (j["block_hash"].is_number_unsigned()) {
            event.block_hash = j["block_hash"].get<uint64_t>();
        } else if (j["block_hash"].is_number_integer()) {
            event.block_hash = static_cast<uint64_t>(j["block_hash"].get<int64_t>());
        } else {
            spdlog::warn("Dropping KV event with non-integer block_hash");
            return std::nullopt;
        }
    }
    return event;
}

std::string serializeKvEvent(const KvCacheEvent& event) {
    nlohmann::json j;
    j["event_id"] = event.event_id;
    j["worker_id"] = event.worker.worker_id;
    j["dp_rank"] = event.worker.dp_rank;
    j["action"] = to_string(event.action);
    j["timestamp"] = event.timestamp_ms;
    if (event.action != KvEventAction::kCleared) {
        j["block_hash"] = event.block_hash;
    }
    return j.dump();
}

}  // namespace kvplane
