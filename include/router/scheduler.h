#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "discovery/worker_ref.h"
#include "kv/block_hash.h"
#include "router/active_load.h"

namespace kvplane {

class WorkerRegistry;

struct RouterConfigOverride {
    std::optional<double> overlap_weight;
    std::optional<double> temperature;
};

struct SchedulerConfig {
    uint32_t block_size{kDefaultBlockSize};
    double overlap_weight{1.0};
    double load_weight{1.0};
    /// 0 selects the best score deterministically; > 0 samples a softmax.
    double temperature{0.0};
    /// Fixed seed for the softmax sampler (random when unset).
    std::optional<uint64_t> seed;
};

struct SchedulingRequest {
    std::string request_id;
    std::vector<SequenceHash> block_hashes;
    uint64_t input_tokens{0};
    std::unordered_map<WorkerRef, uint32_t> overlaps;
    /// Externally observed loads; the tracked loads are used when absent.
    std::optional<std::map<WorkerRef, WorkerLoad>> loads;
    std::optional<RouterConfigOverride> config_override;
    /// Restrict the decision to these workers (all registered workers when empty).
    std::vector<WorkerRef> candidates;
    bool update_states{true};
};

struct SchedulingResult {
    WorkerRef worker;
    uint32_t overlap_blocks{0};
    double score{0.0};
    size_t candidate_count{0};
    bool reserved{false};
};

struct PotentialLoad {
    WorkerRef worker;
    uint64_t potential_prefill_tokens{0};
    uint64_t potential_decode_blocks{0};
};

/// Single-writer decision loop.
///
/// Every mutation of load accounting runs on one internal thread, in
/// submission order. Producers enqueue work and wait on futures. After
/// shutdown() queued requests fail with RouterError(kCancelled) and new
/// submissions throw it immediately.
class Scheduler {
public:
    Scheduler(SchedulerConfig config, WorkerRegistry& registry);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    std::future<SchedulingResult> schedule(SchedulingRequest request);

    void free(const std::string& request_id);
    void markPrefillComplete(const std::string& request_id);
    void updateRuntimeConfig(const WorkerRef& worker, const RuntimeConfig& runtime);

    /// Drop all load accounting. Decisions stay correct; only placement quality
    /// drops until reservations build up again.
    void reset();

    std::future<std::vector<PotentialLoad>> potentialLoads(
        std::unordered_map<WorkerRef, uint32_t> overlaps, uint64_t input_tokens);
    std::future<std::map<WorkerRef, WorkerLoad>> activeLoads();

    void shutdown();
    bool isShutdown() const;

    const SchedulerConfig& config() const { return config_; }

#ifdef KVPLANE_TESTING
    /// Run `fn` on the decision loop, in order with everything else.
    void postForTest(std::function<void()> fn);
#endif

private:
    struct Task {
        std::function<void()> run;
        std::function<void()> cancel;
    };

    bool tryPost(Task task);
    void post(Task task);
    void run();

    SchedulingResult decide(const SchedulingRequest& request);
    uint32_t gpuCount(const WorkerRef& worker) const;

    SchedulerConfig config_;
    WorkerRegistry& registry_;
    size_t subscription_id_{0};

    // Loop-owned state: touched only from run().
    ActiveLoadTracker loads_;
    std::unordered_map<WorkerRef, RuntimeConfig> runtime_configs_;
    std::mt19937_64 rng_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stop_{false};
    std::thread worker_;
};

}  // namespace kvplane
