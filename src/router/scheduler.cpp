#include "router/scheduler.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "discovery/worker_registry.h"
#include "router/router_error.h"

namespace kvplane {

namespace {

constexpr double kScoreEpsilon = 1e-9;

struct ScoredCandidate {
    WorkerRef worker;
    uint32_t overlap{0};
    double score{0.0};
    double load{0.0};
};

std::mt19937_64 makeRng(const std::optional<uint64_t>& seed) {
    if (seed) {
        return std::mt19937_64(*seed);
    }
    return std::mt19937_64(std::random_device{}());
}

}  // namespace

Scheduler::Scheduler(SchedulerConfig config, WorkerRegistry& registry)
    : config_(std::move(config))
    , registry_(registry)
    , rng_(makeRng(config_.seed)) {
    if (config_.block_size == 0) {
        spdlog::warn("Scheduler block_size 0 is invalid, using {}", kDefaultBlockSize);
        config_.block_size = kDefaultBlockSize;
    }
    worker_ = std::thread(&Scheduler::run, this);

    subscription_id_ = registry_.subscribe([this](const WorkerEvent& event) {
        const WorkerRef worker = event.worker;
        if (event.kind == WorkerEventKind::kRemoved) {
            tryPost(Task{[this, worker]() {
                          size_t dropped = loads_.removeWorker(worker);
                          runtime_configs_.erase(worker);
                          if (dropped > 0) {
                              spdlog::info("Dropped {} reservations of removed worker {}", dropped,
                                           to_string(worker));
                          }
                      },
                      {}});
        } else {
            const RuntimeConfig runtime = event.runtime;
            tryPost(Task{[this, worker, runtime]() { runtime_configs_[worker] = runtime; }, {}});
        }
    });
}

Scheduler::~Scheduler() {
    shutdown();
}

bool Scheduler::tryPost(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void Scheduler::post(Task task) {
    if (!tryPost(std::move(task))) {
        throw RouterError(RouterErrorCode::kCancelled, "scheduler is shut down");
    }
}

#ifdef KVPLANE_TESTING
void Scheduler::postForTest(std::function<void()> fn) {
    post(Task{std::move(fn), {}});
}
#endif

void Scheduler::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (stop_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task.run();
    }
}

void Scheduler::shutdown() {
    std::deque<Task> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
        pending.swap(tasks_);
    }
    cv_.notify_all();
    registry_.unsubscribe(subscription_id_);
    if (worker_.joinable()) {
        worker_.join();
    }
    for (auto& task : pending) {
        if (task.cancel) {
            task.cancel();
        }
    }
    spdlog::info("Scheduler stopped ({} queued tasks abandoned)", pending.size());
}

bool Scheduler::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

std::future<SchedulingResult> Scheduler::schedule(SchedulingRequest request) {
    auto promise = std::make_shared<std::promise<SchedulingResult>>();
    auto future = promise->get_future();
    auto shared_request = std::make_shared<SchedulingRequest>(std::move(request));

    post(Task{[this, promise, shared_request]() {
                  try {
                      promise->set_value(decide(*shared_request));
                  } catch (...) {
                      promise->set_exception(std::current_exception());
                  }
              },
              [promise]() {
                  promise->set_exception(std::make_exception_ptr(
                      RouterError(RouterErrorCode::kCancelled, "scheduler shut down before deciding")));
              }});
    return future;
}

void Scheduler::free(const std::string& request_id) {
    bool queued = tryPost(Task{[this, request_id]() {
                                   if (!loads_.free(request_id)) {
                                       spdlog::debug("free({}) ignored: no active reservation", request_id);
                                   }
                               },
                               {}});
    if (!queued) {
        spdlog::debug("Ignoring free({}) after scheduler shutdown", request_id);
    }
}

void Scheduler::markPrefillComplete(const std::string& request_id) {
    bool queued = tryPost(Task{[this, request_id]() { loads_.markPrefillComplete(request_id); }, {}});
    if (!queued) {
        spdlog::debug("Ignoring markPrefillComplete({}) after scheduler shutdown", request_id);
    }
}

void Scheduler::updateRuntimeConfig(const WorkerRef& worker, const RuntimeConfig& runtime) {
    post(Task{[this, worker, runtime]() { runtime_configs_[worker] = runtime; }, {}});
}

void Scheduler::reset() {
    post(Task{[this]() {
                  loads_.clear();
                  spdlog::info("Scheduler load state reset");
              },
              {}});
}

std::future<std::vector<PotentialLoad>> Scheduler::potentialLoads(
    std::unordered_map<WorkerRef, uint32_t> overlaps, uint64_t input_tokens) {
    auto promise = std::make_shared<std::promise<std::vector<PotentialLoad>>>();
    auto future = promise->get_future();
    auto shared_overlaps = std::make_shared<std::unordered_map<WorkerRef, uint32_t>>(std::move(overlaps));

    post(Task{[this, promise, shared_overlaps, input_tokens]() {
                  const uint32_t bs = config_.block_size;
                  const uint64_t request_blocks = blocksForTokens(input_tokens, bs);
                  std::vector<PotentialLoad> out;
                  for (const auto& worker : registry_.snapshot()) {
                      uint64_t cached = 0;
                      auto it = shared_overlaps->find(worker);
                      if (it != shared_overlaps->end()) {
                          cached = std::min<uint64_t>(uint64_t{it->second} * bs, input_tokens);
                      }
                      WorkerLoad current = loads_.load(worker);
                      out.push_back(PotentialLoad{worker, current.prefill_tokens + (input_tokens - cached),
                                                  current.decode_blocks + request_blocks});
                  }
                  promise->set_value(std::move(out));
              },
              [promise]() {
                  promise->set_exception(std::make_exception_ptr(
                      RouterError(RouterErrorCode::kCancelled, "scheduler shut down")));
              }});
    return future;
}

std::future<std::map<WorkerRef, WorkerLoad>> Scheduler::activeLoads() {
    auto promise = std::make_shared<std::promise<std::map<WorkerRef, WorkerLoad>>>();
    auto future = promise->get_future();
    post(Task{[this, promise]() { promise->set_value(loads_.snapshot()); },
              [promise]() {
                  promise->set_exception(std::make_exception_ptr(
                      RouterError(RouterErrorCode::kCancelled, "scheduler shut down")));
              }});
    return future;
}

uint32_t Scheduler::gpuCount(const WorkerRef& worker) const {
    auto it = runtime_configs_.find(worker);
    if (it != runtime_configs_.end()) {
        return std::max(1u, it->second.gpu_count);
    }
    if (auto runtime = registry_.runtimeConfig(worker)) {
        return std::max(1u, runtime->gpu_count);
    }
    return 1;
}

SchedulingResult Scheduler::decide(const SchedulingRequest& request) {
    double overlap_weight = config_.overlap_weight;
    double temperature = config_.temperature;
    if (request.config_override) {
        overlap_weight = request.config_override->overlap_weight.value_or(overlap_weight);
        temperature = request.config_override->temperature.value_or(temperature);
    }

    // 1. Only workers registered right now are eligible.
    std::vector<WorkerRef> candidates;
    if (!request.candidates.empty()) {
        for (const auto& worker : request.candidates) {
            if (registry_.contains(worker)) {
                candidates.push_back(worker);
            }
        }
        std::sort(candidates.begin(), candidates.end());
        candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    } else {
        auto snapshot = registry_.snapshot();
        candidates.assign(snapshot.begin(), snapshot.end());
    }
    if (candidates.empty()) {
        throw RouterError(RouterErrorCode::kNoEligibleWorker,
                          "no registered worker for request " + request.request_id);
    }

    // 2. Score.
    const uint32_t bs = config_.block_size;
    const uint64_t request_blocks = std::max<uint64_t>(blocksForTokens(request.input_tokens, bs), 1);
    const uint64_t overlap_denominator =
        request.block_hashes.empty() ? request_blocks : request.block_hashes.size();

    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());
    for (const auto& worker : candidates) {
        ScoredCandidate c;
        c.worker = worker;
        auto it = request.overlaps.find(worker);
        if (it != request.overlaps.end()) {
            c.overlap = static_cast<uint32_t>(std::min<uint64_t>(it->second, overlap_denominator));
        }
        WorkerLoad load;
        if (request.loads) {
            auto lit = request.loads->find(worker);
            if (lit != request.loads->end()) {
                load = lit->second;
            }
        } else {
            load = loads_.load(worker);
        }
        const double gpus = static_cast<double>(gpuCount(worker));
        c.load = (static_cast<double>(load.decode_blocks) + static_cast<double>(load.prefill_tokens) / bs) / gpus;
        const double normalized_overlap = static_cast<double>(c.overlap) / static_cast<double>(overlap_denominator);
        const double load_penalty = config_.load_weight * c.load / static_cast<double>(request_blocks);
        c.score = overlap_weight * normalized_overlap - load_penalty;
        scored.push_back(c);
    }

    // 3-4. Select.
    const ScoredCandidate* chosen = &scored.front();
    if (temperature <= 0.0) {
        for (const auto& c : scored) {
            if (c.score > chosen->score + kScoreEpsilon) {
                chosen = &c;
            } else if (std::fabs(c.score - chosen->score) <= kScoreEpsilon) {
                if (c.load < chosen->load - kScoreEpsilon ||
                    (std::fabs(c.load - chosen->load) <= kScoreEpsilon && c.worker < chosen->worker)) {
                    chosen = &c;
                }
            }
        }
    } else {
        double max_score = -std::numeric_limits<double>::infinity();
        for (const auto& c : scored) {
            max_score = std::max(max_score, c.score);
        }
        std::vector<double> weights;
        weights.reserve(scored.size());
        for (const auto& c : scored) {
            weights.push_back(std::exp((c.score - max_score) / temperature));
        }
        std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
        chosen = &scored[dist(rng_)];
    }

    SchedulingResult result;
    result.worker = chosen->worker;
    result.overlap_blocks = chosen->overlap;
    result.score = chosen->score;
    result.candidate_count = scored.size();

    // 5. Reserve before replying.
    if (request.update_states) {
        if (request.request_id.empty()) {
            throw RouterError(RouterErrorCode::kInvalidRequest, "load reservation requires a request id");
        }
        const uint64_t cached_tokens = std::min<uint64_t>(uint64_t{chosen->overlap} * bs, request.input_tokens);
        result.reserved = loads_.reserve(request.request_id, chosen->worker, request_blocks,
                                         request.input_tokens - cached_tokens);
    }

    spdlog::debug("Request {} -> worker {} (overlap={} blocks, score={:.4f}, candidates={}, temperature={})",
                  request.request_id, to_string(result.worker), result.overlap_blocks, result.score,
                  result.candidate_count, temperature);
    return result;
}

}  // namespace kvplane
