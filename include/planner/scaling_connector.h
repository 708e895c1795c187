#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "planner/capacity_planner.h"
#include "runtime/cancellation.h"

namespace kvplane {

/// Applies replica targets to whatever runs the workers.
class ScalingConnector {
public:
    virtual ~ScalingConnector() = default;

    /// Fire-and-forget; repeating the current target is a no-op.
    virtual void setReplicas(ReplicaRole role, uint32_t count) = 0;

    /// Apply one plan's targets together. Scale-downs are issued before
    /// scale-ups so the deployment never holds the larger of old and new.
    virtual void setTargets(const std::vector<ReplicaTarget>& targets) = 0;

    /// Put targets that exhausted their retries back in flight. Called once
    /// per planner cycle.
    virtual void resubmitFailed() {}

    /// True when the last targets have been applied and the deployment is stable.
    virtual bool isConverged() const = 0;

    virtual std::string name() const = 0;
};

enum class DeploymentStatus {
    kReady,
    kPending,
    kUnknown,
};

const char* to_string(DeploymentStatus status);

/// Orchestrator control plane.
class OrchestrationApi {
public:
    virtual ~OrchestrationApi() = default;

    /// Returns false when the orchestrator rejected or never received the patch.
    virtual bool patchReplicas(const std::string& deployment, ReplicaRole role, uint32_t count) = 0;
    virtual DeploymentStatus getStatus(const std::string& deployment) = 0;
};

/// Declarative JSON merge-patch against
/// `{base_url}/apis/kvplane/v1/namespaces/{namespace}/deployments/{name}`.
class HttpOrchestrationApi : public OrchestrationApi {
public:
    HttpOrchestrationApi(std::string base_url, std::string k8s_namespace = "default",
                         std::string bearer_token = "", std::chrono::seconds timeout = std::chrono::seconds(10));

    bool patchReplicas(const std::string& deployment, ReplicaRole role, uint32_t count) override;
    DeploymentStatus getStatus(const std::string& deployment) override;

    static std::string buildPatchBody(ReplicaRole role, uint32_t count);
    static DeploymentStatus parseStatus(const std::string& body);

private:
    std::string resourcePath(const std::string& deployment) const;

    std::string base_url_;
    std::string namespace_;
    std::string bearer_token_;
    std::chrono::seconds timeout_;
};

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds initial_backoff{200};
    double multiplier{2.0};
};

/// Pushes targets to an OrchestrationApi from a background thread with
/// bounded retry. A target that exhausts its retries is parked until the
/// next resubmitFailed() or setReplicas()/setTargets() call.
class OrchestrationConnector : public ScalingConnector {
public:
    OrchestrationConnector(std::shared_ptr<OrchestrationApi> api, std::string deployment,
                           RetryPolicy policy = RetryPolicy(), CancellationToken cancel = CancellationToken());
    ~OrchestrationConnector() override;

    OrchestrationConnector(const OrchestrationConnector&) = delete;
    OrchestrationConnector& operator=(const OrchestrationConnector&) = delete;

    void setReplicas(ReplicaRole role, uint32_t count) override;
    void setTargets(const std::vector<ReplicaTarget>& targets) override;
    void resubmitFailed() override;
    bool isConverged() const override;
    std::string name() const override { return "orchestration"; }

    void stop();

    std::optional<uint32_t> appliedReplicas(ReplicaRole role) const;

#ifdef KVPLANE_TESTING
    /// Block until nothing is queued or in flight.
    bool waitIdleForTest(std::chrono::milliseconds timeout);
#endif

private:
    void run();
    bool applyWithRetry(ReplicaRole role, uint32_t count);
    // Caller holds mutex_.
    void enqueueLocked(ReplicaRole role, uint32_t count);
    void requeueFailedLocked();
    std::map<ReplicaRole, uint32_t>::iterator nextPendingLocked();

    std::shared_ptr<OrchestrationApi> api_;
    std::string deployment_;
    RetryPolicy policy_;
    CancellationToken cancel_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::map<ReplicaRole, uint32_t> pending_;
    std::map<ReplicaRole, uint32_t> failed_;
    std::map<ReplicaRole, uint32_t> applied_;
    bool in_flight_{false};
    bool stop_{false};
    std::thread worker_;
};

/// Publishes decisions for an external launcher and waits for it to
/// acknowledge them.
class VirtualConnector : public ScalingConnector {
public:
    struct Decision {
        uint64_t decision_id{0};
        uint32_t prefill{0};
        uint32_t decode{0};
    };
    using Listener = std::function<void(const Decision&)>;

    void setReplicas(ReplicaRole role, uint32_t count) override;
    /// Publishes a single decision covering every target.
    void setTargets(const std::vector<ReplicaTarget>& targets) override;
    bool isConverged() const override;
    std::string name() const override { return "virtual"; }

    /// Launcher confirms it has applied everything up to `decision_id`.
    void acknowledge(uint64_t decision_id);

    size_t subscribe(Listener listener);
    void unsubscribe(size_t subscription_id);

    Decision latestDecision() const;

private:
    void publish(const Decision& decision, std::vector<Listener> listeners);

    mutable std::mutex mutex_;
    Decision current_;
    uint64_t acknowledged_{0};
    std::map<size_t, Listener> listeners_;
    size_t next_listener_id_{1};
};

}  // namespace kvplane
