#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "discovery/worker_ref.h"
#include "kv/block_hash.h"

namespace kvplane {

enum class KvEventAction {
    kAdded,
    kRemoved,
    kCleared,  // worker dropped its whole cache; block_hash is ignored
};

const char* to_string(KvEventAction action);

/// One notification from a worker's KV-cache event channel. Delivery is
/// at-least-once; consumers must treat duplicates as no-ops.
struct KvCacheEvent {
    uint64_t event_id{0};
    SequenceHash block_hash{0};
    WorkerRef worker;
    KvEventAction action{KvEventAction::kAdded};
    int64_t timestamp_ms{0};
};

/// Decode one JSON event. Returns nullopt (and logs) on malformed input.
std::optional<KvCacheEvent> parseKvEvent(const std::string& json_text);

std::string serializeKvEvent(const KvCacheEvent& event);

}  // namespace kvplane
