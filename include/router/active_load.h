#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "discovery/worker_ref.h"

namespace kvplane {

struct WorkerLoad {
    uint64_t decode_blocks{0};
    uint64_t prefill_tokens{0};
};

/// In-flight reservations per worker, keyed by request id so each one is
/// released exactly once. Not thread-safe: owned by the scheduler loop.
class ActiveLoadTracker {
public:
    /// Returns false (and changes nothing) when the request id is already reserved.
    bool reserve(const std::string& request_id, const WorkerRef& worker,
                 uint64_t decode_blocks, uint64_t prefill_tokens);

    /// Release the prefill part of a reservation. Returns false when unknown
    /// or already released.
    bool markPrefillComplete(const std::string& request_id);

    /// Release everything the request holds. Returns false when unknown.
    bool free(const std::string& request_id);

    /// Drop every reservation on `worker`. Returns the number of requests dropped.
    size_t removeWorker(const WorkerRef& worker);

    WorkerLoad load(const WorkerRef& worker) const;
    std::map<WorkerRef, WorkerLoad> snapshot() const;
    std::optional<WorkerRef> workerFor(const std::string& request_id) const;

    size_t activeRequests() const { return requests_.size(); }
    void clear();

private:
    struct Reservation {
        WorkerRef worker;
        uint64_t decode_blocks{0};
        uint64_t prefill_tokens{0};
        bool prefill_done{false};
    };

    void release(const WorkerRef& worker, uint64_t decode_blocks, uint64_t prefill_tokens);

    std::unordered_map<std::string, Reservation> requests_;
    std::unordered_map<WorkerRef, WorkerLoad> loads_;
};

}  // namespace kvplane
