#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include "planner/scaling_connector.h"

namespace kvplane {
namespace {

using namespace std::chrono_literals;

class FakeOrchestrationApi : public OrchestrationApi {
public:
    bool patchReplicas(const std::string& deployment, ReplicaRole role, uint32_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (failures_remaining_ > 0) {
            --failures_remaining_;
            return false;
        }
        if (always_throw_) {
            throw std::runtime_error("connection refused");
        }
        patches_.emplace_back(deployment, role, count);
        return true;
    }

    DeploymentStatus getStatus(const std::string&) override { return status_.load(); }

    void failNext(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_remaining_ = n;
    }
    void alwaysThrow(bool value) {
        std::lock_guard<std::mutex> lock(mutex_);
        always_throw_ = value;
    }
    void setStatus(DeploymentStatus status) { status_ = status; }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }
    std::vector<std::tuple<std::string, ReplicaRole, uint32_t>> patches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return patches_;
    }

private:
    mutable std::mutex mutex_;
    int attempts_{0};
    int failures_remaining_{0};
    bool always_throw_{false};
    std::atomic<DeploymentStatus> status_{DeploymentStatus::kReady};
    std::vector<std::tuple<std::string, ReplicaRole, uint32_t>> patches_;
};

RetryPolicy fastRetry(int attempts = 3) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_backoff = 1ms;
    policy.multiplier = 2.0;
    return policy;
}

TEST(OrchestrationConnectorTest, AppliesTargetsInBackground) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    OrchestrationConnector connector(api, "llama", fastRetry());

    connector.setReplicas(ReplicaRole::kPrefill, 3);
    connector.setReplicas(ReplicaRole::kDecode, 2);
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kPrefill), 3u);
    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kDecode), 2u);
    EXPECT_TRUE(connector.isConverged());
    ASSERT_EQ(api->patches().size(), 2u);
    EXPECT_EQ(std::get<0>(api->patches()[0]), "llama");
}

TEST(OrchestrationConnectorTest, RepeatedTargetIsNotResent) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    OrchestrationConnector connector(api, "llama", fastRetry());

    connector.setReplicas(ReplicaRole::kDecode, 4);
    ASSERT_TRUE(connector.waitIdleForTest(2s));
    connector.setReplicas(ReplicaRole::kDecode, 4);
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    EXPECT_EQ(api->patches().size(), 1u);
}

TEST(OrchestrationConnectorTest, RetriesTransientFailures) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    api->failNext(2);
    OrchestrationConnector connector(api, "llama", fastRetry(3));

    connector.setReplicas(ReplicaRole::kPrefill, 5);
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    EXPECT_EQ(api->attempts(), 3);
    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kPrefill), 5u);
    EXPECT_TRUE(connector.isConverged());
}

TEST(OrchestrationConnectorTest, ExhaustedTargetIsResentWithNextCall) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    api->alwaysThrow(true);
    OrchestrationConnector connector(api, "llama", fastRetry(2));

    connector.setReplicas(ReplicaRole::kPrefill, 5);
    ASSERT_TRUE(connector.waitIdleForTest(2s));
    EXPECT_EQ(api->attempts(), 2);
    EXPECT_FALSE(connector.appliedReplicas(ReplicaRole::kPrefill).has_value());
    EXPECT_FALSE(connector.isConverged());

    api->alwaysThrow(false);
    connector.setReplicas(ReplicaRole::kDecode, 1);
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kPrefill), 5u);
    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kDecode), 1u);
    EXPECT_TRUE(connector.isConverged());
}

TEST(OrchestrationConnectorTest, ResubmitRetriesExhaustedTarget) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    api->failNext(2);
    OrchestrationConnector connector(api, "llama", fastRetry(2));

    connector.setReplicas(ReplicaRole::kPrefill, 5);
    ASSERT_TRUE(connector.waitIdleForTest(2s));
    EXPECT_FALSE(connector.isConverged());

    connector.resubmitFailed();
    ASSERT_TRUE(connector.waitIdleForTest(2s));
    EXPECT_EQ(api->attempts(), 3);
    EXPECT_EQ(connector.appliedReplicas(ReplicaRole::kPrefill), 5u);
    EXPECT_TRUE(connector.isConverged());
}

TEST(OrchestrationConnectorTest, ScaleDownsGoBeforeScaleUps) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    OrchestrationConnector connector(api, "llama", fastRetry());

    connector.setTargets({{ReplicaRole::kPrefill, 2}, {ReplicaRole::kDecode, 3}});
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    connector.setTargets({{ReplicaRole::kPrefill, 5}, {ReplicaRole::kDecode, 1}});
    ASSERT_TRUE(connector.waitIdleForTest(2s));

    auto patches = api->patches();
    ASSERT_EQ(patches.size(), 4u);
    EXPECT_EQ(std::get<1>(patches[2]), ReplicaRole::kDecode);
    EXPECT_EQ(std::get<2>(patches[2]), 1u);
    EXPECT_EQ(std::get<1>(patches[3]), ReplicaRole::kPrefill);
    EXPECT_EQ(std::get<2>(patches[3]), 5u);
}

TEST(OrchestrationConnectorTest, PendingDeploymentIsNotConverged) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    api->setStatus(DeploymentStatus::kPending);
    OrchestrationConnector connector(api, "llama", fastRetry());

    connector.setReplicas(ReplicaRole::kPrefill, 1);
    ASSERT_TRUE(connector.waitIdleForTest(2s));
    EXPECT_FALSE(connector.isConverged());

    api->setStatus(DeploymentStatus::kReady);
    EXPECT_TRUE(connector.isConverged());
}

TEST(OrchestrationConnectorTest, StoppedConnectorDropsTargets) {
    auto api = std::make_shared<FakeOrchestrationApi>();
    OrchestrationConnector connector(api, "llama", fastRetry());
    connector.stop();
    connector.setReplicas(ReplicaRole::kPrefill, 2);
    EXPECT_EQ(api->attempts(), 0);
}

TEST(HttpOrchestrationApiTest, BuildsMergePatchForRole) {
    auto body = nlohmann::json::parse(HttpOrchestrationApi::buildPatchBody(ReplicaRole::kDecode, 7));
    EXPECT_EQ(body["spec"]["services"]["decode"]["replicas"], 7);
    EXPECT_FALSE(body["spec"]["services"].contains("prefill"));
}

TEST(HttpOrchestrationApiTest, ParsesDeploymentState) {
    EXPECT_EQ(HttpOrchestrationApi::parseStatus(R"({"status":{"state":"successful"}})"), DeploymentStatus::kReady);
    EXPECT_EQ(HttpOrchestrationApi::parseStatus(R"({"status":{"state":"ready"}})"), DeploymentStatus::kReady);
    EXPECT_EQ(HttpOrchestrationApi::parseStatus(R"({"status":{"state":"progressing"}})"), DeploymentStatus::kPending);
    EXPECT_EQ(HttpOrchestrationApi::parseStatus(R"({"status":{"state":"failed"}})"), DeploymentStatus::kUnknown);
    EXPECT_EQ(HttpOrchestrationApi::parseStatus(R"({"spec":{}})"), DeploymentStatus::kUnknown);
    EXPECT_EQ(HttpOrchestrationApi::parseStatus("not json"), DeploymentStatus::kUnknown);
}

TEST(HttpOrchestrationApiTest, UnreachableOrchestratorReportsFailure) {
    HttpOrchestrationApi api("http://127.0.0.1:1", "default", "", 1s);
    EXPECT_FALSE(api.patchReplicas("llama", ReplicaRole::kPrefill, 1));
    EXPECT_EQ(api.getStatus("llama"), DeploymentStatus::kUnknown);
}

TEST(VirtualConnectorTest, EveryChangeGetsANewDecisionId) {
    VirtualConnector connector;
    connector.setReplicas(ReplicaRole::kPrefill, 0);
    EXPECT_EQ(connector.latestDecision().decision_id, 1u);

    connector.setReplicas(ReplicaRole::kPrefill, 0);
    EXPECT_EQ(connector.latestDecision().decision_id, 1u);

    connector.setReplicas(ReplicaRole::kDecode, 3);
    auto decision = connector.latestDecision();
    EXPECT_EQ(decision.decision_id, 2u);
    EXPECT_EQ(decision.prefill, 0u);
    EXPECT_EQ(decision.decode, 3u);
}

TEST(VirtualConnectorTest, TargetSetIsOneDecision) {
    VirtualConnector connector;
    int published = 0;
    connector.subscribe([&](const VirtualConnector::Decision&) { ++published; });

    connector.setTargets({{ReplicaRole::kPrefill, 5}, {ReplicaRole::kDecode, 3}});
    auto decision = connector.latestDecision();
    EXPECT_EQ(published, 1);
    EXPECT_EQ(decision.decision_id, 1u);
    EXPECT_EQ(decision.prefill, 5u);
    EXPECT_EQ(decision.decode, 3u);

    connector.setTargets({{ReplicaRole::kPrefill, 5}, {ReplicaRole::kDecode, 3}});
    EXPECT_EQ(published, 1);

    connector.setTargets({{ReplicaRole::kPrefill, 2}, {ReplicaRole::kDecode, 6}});
    EXPECT_EQ(published, 2);
    EXPECT_EQ(connector.latestDecision().decision_id, 2u);
}

TEST(VirtualConnectorTest, ConvergesOnceLauncherAcknowledges) {
    VirtualConnector connector;
    EXPECT_TRUE(connector.isConverged());

    connector.setReplicas(ReplicaRole::kPrefill, 2);
    connector.setReplicas(ReplicaRole::kDecode, 2);
    EXPECT_FALSE(connector.isConverged());

    connector.acknowledge(1);
    EXPECT_FALSE(connector.isConverged());
    connector.acknowledge(9);  // unknown decision
    EXPECT_FALSE(connector.isConverged());
    connector.acknowledge(2);
    EXPECT_TRUE(connector.isConverged());
}

TEST(VirtualConnectorTest, ListenersReceiveDecisions) {
    VirtualConnector connector;
    std::vector<VirtualConnector::Decision> seen;
    connector.subscribe([](const VirtualConnector::Decision&) { throw std::runtime_error("launcher down"); });
    auto id = connector.subscribe([&](const VirtualConnector::Decision& d) { seen.push_back(d); });

    connector.setReplicas(ReplicaRole::kPrefill, 4);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].prefill, 4u);

    connector.unsubscribe(id);
    connector.setReplicas(ReplicaRole::kPrefill, 5);
    EXPECT_EQ(seen.size(), 1u);
}

}  // namespace
}  // namespace kvplane
