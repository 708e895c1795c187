#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "discovery/discovery_client.h"
#include "discovery/worker_registry.h"
#include "kv/kv_event.h"
#include "metrics/prometheus_exporter.h"
#include "planner/capacity_planner.h"
#include "planner/metrics_collector.h"
#include "planner/metrics_source.h"
#include "planner/scaling_connector.h"
#include "planner/sla_planner.h"
#include "planner/throughput_table.h"
#include "router/kv_router.h"
#include "router/router_error.h"
#include "runtime/cancellation.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

// One-shot commands print results on stdout; keep logs on stderr.
void initStderrLogging() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    const char* level = std::getenv("KVPLANE_LOG_LEVEL");
    kvplane::logger::init(level ? level : "warn", "[%Y-%m-%d %T.%e] [%l] %v", "", {sink});
}

std::unique_ptr<kvplane::ScalingConnector> makeConnector(const kvplane::PlannerConfig& cfg,
                                                         const kvplane::CancellationToken& token) {
    if (cfg.connector == "orchestration") {
        if (cfg.orchestrator_url.empty()) {
            spdlog::error("connector=orchestration requires orchestrator_url");
            return nullptr;
        }
        auto api = std::make_shared<kvplane::HttpOrchestrationApi>(cfg.orchestrator_url, cfg.k8s_namespace);
        return std::make_unique<kvplane::OrchestrationConnector>(api, cfg.deployment, kvplane::RetryPolicy(),
                                                                 token);
    }
    if (cfg.connector != "virtual") {
        spdlog::warn("Unknown connector '{}', using virtual", cfg.connector);
    }
    auto connector = std::make_unique<kvplane::VirtualConnector>();
    // stdout is the launcher: each decision is emitted as one JSON line and
    // considered applied once written.
    auto* raw = connector.get();
    connector->subscribe([raw](const kvplane::VirtualConnector::Decision& d) {
        nlohmann::json line = {{"decision_id", d.decision_id}, {"prefill", d.prefill}, {"decode", d.decode}};
        std::cout << line.dump() << std::endl;
        raw->acknowledge(d.decision_id);
    });
    return connector;
}

int run_planner(const kvplane::PlannerOptions& opts) {
    kvplane::logger::init_from_env();

    auto [cfg, sources] = kvplane::loadPlannerConfigWithLog(opts.config_path);
    spdlog::info("Planner config: {}", sources);
    if (opts.dry_run) {
        cfg.sla.dry_run = true;
    }

    if (cfg.profile_path.empty()) {
        spdlog::error("No throughput profile configured (planner.profile or KVPLANE_PROFILE)");
        return 1;
    }
    auto profile = kvplane::loadThroughputProfile(cfg.profile_path);
    if (!profile) {
        return 1;
    }

    kvplane::CancellationToken token;
    kvplane::metrics::PrometheusExporter exporter;

    kvplane::PrometheusMetricsSource source(cfg.prometheus_url);
    kvplane::CollectorConfig collector_cfg;
    collector_cfg.interval = cfg.sla.adjustment_interval;
    collector_cfg.window_size = cfg.window_size;
    collector_cfg.queries = cfg.queries;
    kvplane::MetricsCollector collector(source, collector_cfg);

    auto connector = makeConnector(cfg, token);
    if (!connector) {
        return 1;
    }

    kvplane::SlaPlanner planner(cfg.sla, collector, std::move(*profile), *connector, &exporter, token);

    if (opts.once) {
        auto result = planner.runCycle();
        std::cout << "cycle: " << kvplane::to_string(result.outcome);
        if (result.plan) {
            std::cout << " prefill=" << result.plan->prefill_replicas << " decode=" << result.plan->decode_replicas;
        }
        std::cout << std::endl;
        return result.outcome == kvplane::CycleOutcome::kFailed ? 1 : 0;
    }

    httplib::Server server;
    std::thread server_thread;
    if (opts.metrics_port != 0) {
        server.Get("/metrics", [&exporter](const httplib::Request&, httplib::Response& res) {
            res.set_content(exporter.render(), "text/plain");
        });
        server_thread = std::thread([&server, port = opts.metrics_port]() {
            if (!server.listen("0.0.0.0", port)) {
                spdlog::error("Failed to serve metrics on port {}", port);
            }
        });
        spdlog::info("Serving metrics on :{}/metrics", opts.metrics_port);
    }

    planner.start();
    while (kvplane::is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    token.cancel();
    planner.stop();

    if (server_thread.joinable()) {
        server.stop();
        server_thread.join();
    }
    spdlog::info("Planner exited");
    return 0;
}

int run_plan(const kvplane::PlanOptions& opts) {
    initStderrLogging();

    auto profile = kvplane::loadThroughputProfile(opts.profile);
    if (!profile) {
        std::cerr << "Error: cannot load throughput profile " << opts.profile << std::endl;
        return 1;
    }

    kvplane::PlannerInputs inputs;
    inputs.forecast.request_count = opts.requests;
    inputs.forecast.input_len = opts.isl;
    inputs.forecast.output_len = opts.osl;
    inputs.interval_s = opts.interval_secs;
    inputs.itl_sla_ms = opts.itl_ms;
    inputs.gpu_budget = opts.gpu_budget;
    inputs.min_replicas = opts.min_replicas;
    inputs.gpus_per_prefill_replica = opts.prefill_gpus;
    inputs.gpus_per_decode_replica = opts.decode_gpus;

    auto plan = kvplane::computeReplicaPlan(inputs, *profile);
    nlohmann::json out = {
        {"prefill_replicas", plan.prefill_replicas},
        {"decode_replicas", plan.decode_replicas},
        {"unclamped_prefill", plan.unclamped_prefill},
        {"unclamped_decode", plan.unclamped_decode},
        {"prefill_throughput_required", plan.prefill_throughput_required},
        {"decode_throughput_required", plan.decode_throughput_required},
        {"expected_ttft_ms", profile->prefill.ttftMs(opts.isl)},
        {"gpus", plan.gpuCount(inputs)},
        {"capacity_infeasible", plan.capacity_infeasible},
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_replay(const kvplane::ReplayOptions& opts) {
    initStderrLogging();

    kvplane::WorkerRegistry registry;
    const bool static_workers = !opts.workers_path.empty();
    if (static_workers) {
        auto workers = kvplane::loadWorkersFromJson(opts.workers_path);
        if (!workers) {
            std::cerr << "Error: cannot load workers from " << opts.workers_path << std::endl;
            return 1;
        }
        for (const auto& info : *workers) {
            registry.addWorker(info.worker, info.runtime);
        }
    }

    kvplane::KvRouterConfig router_cfg;
    router_cfg.scheduler.block_size = opts.block_size;
    router_cfg.scheduler.temperature = opts.temperature;
    kvplane::KvRouter router(router_cfg, registry);

    std::ifstream ifs(opts.events_path);
    if (!ifs.is_open()) {
        std::cerr << "Error: cannot open " << opts.events_path << std::endl;
        return 1;
    }
    size_t applied = 0;
    size_t dropped = 0;
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.empty()) continue;
        auto event = kvplane::parseKvEvent(line);
        if (!event) {
            ++dropped;
            continue;
        }
        if (!static_workers && !registry.contains(event->worker)) {
            registry.addWorker(event->worker);
        }
        router.applyKvEvent(*event);
        ++applied;
    }

    auto hashes = kvplane::computeBlockHashes(opts.tokens, opts.block_size);
    auto overlaps = router.indexer().findMatches(hashes);

    kvplane::RouteRequest request;
    request.request_id = "replay";
    request.tokens = opts.tokens;
    request.update_states = false;

    nlohmann::json out;
    out["events_applied"] = applied;
    out["events_dropped"] = dropped;
    out["blocks"] = hashes.size();
    nlohmann::json per_worker = nlohmann::json::array();
    for (const auto& worker : registry.snapshot()) {
        per_worker.push_back({{"worker_id", worker.worker_id},
                              {"dp_rank", worker.dp_rank},
                              {"overlap_blocks", overlaps.scoreFor(worker)}});
    }
    out["workers"] = per_worker;

    try {
        auto decision = router.route(std::move(request));
        out["selected"] = {{"worker_id", decision.worker.worker_id},
                           {"dp_rank", decision.worker.dp_rank},
                           {"overlap_blocks", decision.overlap_blocks},
                           {"score", decision.score},
                           {"fallback", decision.fallback}};
    } catch (const kvplane::RouterError& e) {
        out["error"] = e.what();
        std::cout << out.dump(2) << std::endl;
        return 1;
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    kvplane::request_shutdown();
}

}  // namespace

#ifndef KVPLANE_TESTING
int main(int argc, char* argv[]) {
    auto cli_result = kvplane::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        switch (cli_result.subcommand) {
            case kvplane::Subcommand::Planner:
                std::cout << "kvplane v" << KVPLANE_VERSION << " planner starting..." << std::endl;
                return run_planner(cli_result.planner_options);
            case kvplane::Subcommand::Plan:
                return run_plan(cli_result.plan_options);
            case kvplane::Subcommand::Replay:
                return run_replay(cli_result.replay_options);
            case kvplane::Subcommand::None:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    std::cerr << kvplane::getHelpMessage();
    return 1;
}
#endif
