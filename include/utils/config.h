#pragma once

#include <string>
#include <utility>

#include "planner/metrics_collector.h"
#include "planner/sla_planner.h"
#include "router/kv_router.h"

namespace kvplane {

struct RouterConfig {
    KvRouterConfig kv;
    /// Static worker list for the JSON discovery source.
    std::string workers_file;
};

struct PlannerConfig {
    SlaPlannerConfig sla;
    size_t window_size{50};
    MetricQueries queries;
    std::string profile_path;
    std::string prometheus_url{"http://localhost:9090"};
    /// "virtual" or "orchestration".
    std::string connector{"virtual"};
    std::string orchestrator_url;
    std::string deployment{"kvplane"};
    std::string k8s_namespace{"default"};
};

// Config file: `path` when given, else $KVPLANE_CONFIG, else
// ~/.kvplane/config.json. Environment variables override the file.
// The second member describes where values came from ("...|sources=env,file").
std::pair<RouterConfig, std::string> loadRouterConfigWithLog(const std::string& path = "");
RouterConfig loadRouterConfig(const std::string& path = "");

std::pair<PlannerConfig, std::string> loadPlannerConfigWithLog(const std::string& path = "");
PlannerConfig loadPlannerConfig(const std::string& path = "");

}  // namespace kvplane
