#include "planner/scaling_connector.h"

#include <algorithm>
#include <vector>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/url_encode.h"

namespace kvplane {

const char* to_string(DeploymentStatus status) {
    switch (status) {
        case DeploymentStatus::kReady:
            return "ready";
        case DeploymentStatus::kPending:
            return "pending";
        case DeploymentStatus::kUnknown:
            return "unknown";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// HttpOrchestrationApi

HttpOrchestrationApi::HttpOrchestrationApi(std::string base_url, std::string k8s_namespace,
                                           std::string bearer_token, std::chrono::seconds timeout)
    : base_url_(std::move(base_url))
    , namespace_(std::move(k8s_namespace))
    , bearer_token_(std::move(bearer_token))
    , timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HttpOrchestrationApi::resourcePath(const std::string& deployment) const {
    return "/apis/kvplane/v1/namespaces/" + urlEncode(namespace_) + "/deployments/" + urlEncode(deployment);
}

std::string HttpOrchestrationApi::buildPatchBody(ReplicaRole role, uint32_t count) {
    nlohmann::json body;
    body["spec"]["services"][to_string(role)]["replicas"] = count;
    return body.dump();
}

DeploymentStatus HttpOrchestrationApi::parseStatus(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.contains("status") || !j["status"].is_object()) {
            return DeploymentStatus::kUnknown;
        }
        const std::string state = j["status"].value("state", "");
        if (state == "ready" || state == "successful") {
            return DeploymentStatus::kReady;
        }
        if (state == "pending" || state == "progressing" || state == "reconciling") {
            return DeploymentStatus::kPending;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed deployment status: {}", e.what());
    }
    return DeploymentStatus::kUnknown;
}

bool HttpOrchestrationApi::patchReplicas(const std::string& deployment, ReplicaRole role, uint32_t count) {
    httplib::Client client(base_url_);
    client.set_connection_timeout(static_cast<time_t>(timeout_.count()), 0);
    client.set_read_timeout(static_cast<time_t>(timeout_.count()), 0);

    httplib::Headers headers;
    if (!bearer_token_.empty()) {
        headers.emplace("Authorization", "Bearer " + bearer_token_);
    }
    auto res = client.Patch(resourcePath(deployment), headers, buildPatchBody(role, count),
                            "application/merge-patch+json");
    if (!res) {
        spdlog::warn("PATCH {} failed: {}", deployment, httplib::to_string(res.error()));
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::warn("PATCH {} rejected with HTTP {}: {}", deployment, res->status, res->body);
        return false;
    }
    return true;
}

DeploymentStatus HttpOrchestrationApi::getStatus(const std::string& deployment) {
    httplib::Client client(base_url_);
    client.set_connection_timeout(static_cast<time_t>(timeout_.count()), 0);
    client.set_read_timeout(static_cast<time_t>(timeout_.count()), 0);

    httplib::Headers headers;
    if (!bearer_token_.empty()) {
        headers.emplace("Authorization", "Bearer " + bearer_token_);
    }
    auto res = client.Get(resourcePath(deployment), headers);
    if (!res || res->status != 200) {
        spdlog::debug("Status query for {} failed", deployment);
        return DeploymentStatus::kUnknown;
    }
    return parseStatus(res->body);
}

// ---------------------------------------------------------------------------
// OrchestrationConnector

OrchestrationConnector::OrchestrationConnector(std::shared_ptr<OrchestrationApi> api, std::string deployment,
                                               RetryPolicy policy, CancellationToken cancel)
    : api_(std::move(api))
    , deployment_(std::move(deployment))
    , policy_(policy)
    , cancel_(std::move(cancel)) {
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
    worker_ = std::thread(&OrchestrationConnector::run, this);
}

OrchestrationConnector::~OrchestrationConnector() {
    stop();
}

void OrchestrationConnector::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void OrchestrationConnector::requeueFailedLocked() {
    for (const auto& [role, count] : failed_) {
        if (pending_.count(role) == 0) {
            pending_[role] = count;
        }
    }
    failed_.clear();
}

void OrchestrationConnector::enqueueLocked(ReplicaRole role, uint32_t count) {
    failed_.erase(role);
    auto applied = applied_.find(role);
    if (pending_.count(role) == 0 && applied != applied_.end() && applied->second == count) {
        return;
    }
    pending_[role] = count;
}

void OrchestrationConnector::setReplicas(ReplicaRole role, uint32_t count) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            spdlog::warn("Connector stopped; dropping {} target {}", to_string(role), count);
            return;
        }
        enqueueLocked(role, count);
        requeueFailedLocked();
    }
    cv_.notify_all();
}

void OrchestrationConnector::setTargets(const std::vector<ReplicaTarget>& targets) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            spdlog::warn("Connector stopped; dropping {} targets", targets.size());
            return;
        }
        for (const auto& target : targets) {
            enqueueLocked(target.role, target.desired_count);
        }
        requeueFailedLocked();
    }
    cv_.notify_all();
}

void OrchestrationConnector::resubmitFailed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ || failed_.empty()) {
            return;
        }
        for (const auto& [role, count] : failed_) {
            spdlog::info("Re-sending {} {} target {} after earlier failure", deployment_, to_string(role), count);
        }
        requeueFailedLocked();
    }
    cv_.notify_all();
}

std::map<ReplicaRole, uint32_t>::iterator OrchestrationConnector::nextPendingLocked() {
    // Shrinking first keeps the deployment within what both plans allow.
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        auto applied = applied_.find(it->first);
        if (applied != applied_.end() && it->second < applied->second) {
            return it;
        }
    }
    return pending_.begin();
}

bool OrchestrationConnector::isConverged() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.empty() || !failed_.empty() || in_flight_) {
            return false;
        }
    }
    try {
        return api_->getStatus(deployment_) == DeploymentStatus::kReady;
    } catch (const std::exception& e) {
        spdlog::warn("Deployment status check failed: {}", e.what());
        return false;
    }
}

std::optional<uint32_t> OrchestrationConnector::appliedReplicas(ReplicaRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = applied_.find(role);
    if (it == applied_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void OrchestrationConnector::run() {
    for (;;) {
        ReplicaRole role;
        uint32_t count;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !pending_.empty(); });
            if (stop_) {
                return;
            }
            auto it = nextPendingLocked();
            role = it->first;
            count = it->second;
            pending_.erase(it);
            in_flight_ = true;
        }

        const bool ok = applyWithRetry(role, count);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
            if (ok) {
                applied_[role] = count;
            } else if (pending_.count(role) == 0) {
                failed_[role] = count;
            }
        }
        idle_cv_.notify_all();
    }
}

bool OrchestrationConnector::applyWithRetry(ReplicaRole role, uint32_t count) {
    auto backoff = policy_.initial_backoff;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (cancel_.isCancelled()) {
            return false;
        }
        try {
            if (api_->patchReplicas(deployment_, role, count)) {
                spdlog::info("Scaled {} {} to {} replicas", deployment_, to_string(role), count);
                return true;
            }
        } catch (const std::exception& e) {
            spdlog::warn("patchReplicas threw: {}", e.what());
        }
        spdlog::warn("Scaling {} {} to {} failed (attempt {}/{})", deployment_, to_string(role), count, attempt,
                     policy_.max_attempts);
        if (attempt == policy_.max_attempts) {
            break;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, backoff, [this]() { return stop_ || cancel_.isCancelled(); })) {
            return false;
        }
        backoff = std::chrono::milliseconds(static_cast<int64_t>(backoff.count() * policy_.multiplier));
    }
    spdlog::error("ScalingConnectorError: could not set {} {} to {} replicas after {} attempts; retrying next "
                  "interval",
                  deployment_, to_string(role), count, policy_.max_attempts);
    return false;
}

#ifdef KVPLANE_TESTING
bool OrchestrationConnector::waitIdleForTest(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return pending_.empty() && !in_flight_; });
}
#endif

// ---------------------------------------------------------------------------
// VirtualConnector

void VirtualConnector::setReplicas(ReplicaRole role, uint32_t count) {
    setTargets({ReplicaTarget{role, count}});
}

void VirtualConnector::setTargets(const std::vector<ReplicaTarget>& targets) {
    Decision decision;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Decision next = current_;
        for (const auto& target : targets) {
            (target.role == ReplicaRole::kPrefill ? next.prefill : next.decode) = target.desired_count;
        }
        if (current_.decision_id > 0 && next.prefill == current_.prefill && next.decode == current_.decode) {
            return;
        }
        ++next.decision_id;
        current_ = next;
        decision = current_;
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    publish(decision, std::move(listeners));
}

void VirtualConnector::publish(const Decision& decision, std::vector<Listener> listeners) {
    spdlog::info("Scaling decision {}: prefill={} decode={}", decision.decision_id, decision.prefill,
                 decision.decode);
    for (const auto& listener : listeners) {
        try {
            listener(decision);
        } catch (const std::exception& e) {
            spdlog::error("Scaling decision listener threw: {}", e.what());
        }
    }
}

bool VirtualConnector::isConverged() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acknowledged_ >= current_.decision_id;
}

void VirtualConnector::acknowledge(uint64_t decision_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (decision_id > current_.decision_id) {
        spdlog::warn("Ignoring acknowledgement of unknown decision {}", decision_id);
        return;
    }
    acknowledged_ = std::max(acknowledged_, decision_id);
}

size_t VirtualConnector::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void VirtualConnector::unsubscribe(size_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(subscription_id);
}

VirtualConnector::Decision VirtualConnector::latestDecision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

}  // namespace kvplane
