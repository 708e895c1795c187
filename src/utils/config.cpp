#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kvplane {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (!home.empty()) return home / ".kvplane/config.json";
    return std::filesystem::path();
}

std::filesystem::path resolveConfigPath(const std::string& explicit_path) {
    if (!explicit_path.empty()) return explicit_path;
    if (auto env = getEnvValue("KVPLANE_CONFIG")) return *env;
    return defaultConfigPath();
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) return false;
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config {}: {}", path.string(), e.what());
        return false;
    }
}

// Reads the named section of the config file, if present.
bool loadSection(const std::string& explicit_path, const char* section, nlohmann::json& out,
                 std::ostringstream& log) {
    auto path = resolveConfigPath(explicit_path);
    nlohmann::json j;
    if (!readJson(path, j) || !j.is_object() || !j.contains(section) || !j[section].is_object()) {
        return false;
    }
    out = j[section];
    log << "file=" << path << " ";
    return true;
}

template <typename T>
void readNumber(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

// Parses a positive integer env value; keeps `out` on bad input.
template <typename T>
bool envPositive(const char* name, T& out, std::ostringstream& log) {
    auto v = getEnvValue(name);
    if (!v) return false;
    try {
        long long parsed = std::stoll(*v);
        if (parsed > 0) {
            out = static_cast<T>(parsed);
            log << "env:" << name << "=" << parsed << " ";
            return true;
        }
    } catch (const std::exception&) {
    }
    spdlog::warn("Ignoring invalid {}='{}'", name, *v);
    return false;
}

bool envDouble(const char* name, double& out, bool allow_zero, std::ostringstream& log) {
    auto v = getEnvValue(name);
    if (!v) return false;
    try {
        double parsed = std::stod(*v);
        if (parsed > 0.0 || (allow_zero && parsed == 0.0)) {
            out = parsed;
            log << "env:" << name << "=" << parsed << " ";
            return true;
        }
    } catch (const std::exception&) {
    }
    spdlog::warn("Ignoring invalid {}='{}'", name, *v);
    return false;
}

bool envString(const char* name, std::string& out, std::ostringstream& log) {
    auto v = getEnvValue(name);
    if (!v || v->empty()) return false;
    out = *v;
    log << "env:" << name << "=" << *v << " ";
    return true;
}

std::string finishLog(std::ostringstream& log, bool used_env, bool used_file) {
    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";
    return log.str();
}

}  // namespace

std::pair<RouterConfig, std::string> loadRouterConfigWithLog(const std::string& path) {
    RouterConfig cfg;
    auto& kv = cfg.kv;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    nlohmann::json j;
    if (loadSection(path, "router", j, log)) {
        used_file = true;
        uint32_t block_size = kv.scheduler.block_size;
        readNumber(j, "block_size", block_size);
        if (block_size > 0) kv.scheduler.block_size = block_size;
        if (j.contains("indexer") && j["indexer"].is_string()) {
            kv.indexer.mode = parseIndexerMode(j["indexer"].get<std::string>());
        }
        int64_t ttl_ms = kv.indexer.ttl.count();
        readNumber(j, "approx_ttl_ms", ttl_ms);
        if (ttl_ms > 0) kv.indexer.ttl = std::chrono::milliseconds(ttl_ms);
        readNumber(j, "overlap_weight", kv.scheduler.overlap_weight);
        readNumber(j, "load_weight", kv.scheduler.load_weight);
        double temperature = kv.scheduler.temperature;
        readNumber(j, "temperature", temperature);
        if (temperature >= 0.0) kv.scheduler.temperature = temperature;
        if (j.contains("seed") && j["seed"].is_number_unsigned()) {
            kv.scheduler.seed = j["seed"].get<uint64_t>();
        }
        int64_t timeout_ms = kv.scheduler_timeout.count();
        readNumber(j, "scheduler_timeout_ms", timeout_ms);
        if (timeout_ms > 0) kv.scheduler_timeout = std::chrono::milliseconds(timeout_ms);
        readString(j, "workers_file", cfg.workers_file);
    }

    used_env |= envPositive("KVPLANE_BLOCK_SIZE", kv.scheduler.block_size, log);
    if (auto v = getEnvValue("KVPLANE_INDEXER")) {
        kv.indexer.mode = parseIndexerMode(*v);
        log << "env:KVPLANE_INDEXER=" << to_string(kv.indexer.mode) << " ";
        used_env = true;
    }
    used_env |= envDouble("KVPLANE_ROUTER_TEMPERATURE", kv.scheduler.temperature, true, log);
    used_env |= envDouble("KVPLANE_OVERLAP_WEIGHT", kv.scheduler.overlap_weight, true, log);
    int64_t timeout_ms = kv.scheduler_timeout.count();
    if (envPositive("KVPLANE_SCHEDULER_TIMEOUT_MS", timeout_ms, log)) {
        kv.scheduler_timeout = std::chrono::milliseconds(timeout_ms);
        used_env = true;
    }
    used_env |= envString("KVPLANE_WORKERS_FILE", cfg.workers_file, log);

    return {cfg, finishLog(log, used_env, used_file)};
}

RouterConfig loadRouterConfig(const std::string& path) {
    return loadRouterConfigWithLog(path).first;
}

std::pair<PlannerConfig, std::string> loadPlannerConfigWithLog(const std::string& path) {
    PlannerConfig cfg;
    auto& sla = cfg.sla;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    nlohmann::json j;
    if (loadSection(path, "planner", j, log)) {
        used_file = true;
        int64_t interval = sla.adjustment_interval.count();
        readNumber(j, "adjustment_interval_secs", interval);
        if (interval > 0) sla.adjustment_interval = std::chrono::seconds(interval);
        readNumber(j, "ttft_ms", sla.ttft_sla_ms);
        readNumber(j, "itl_ms", sla.itl_sla_ms);
        readNumber(j, "gpu_budget", sla.gpu_budget);
        readNumber(j, "min_replicas", sla.min_replicas);
        readNumber(j, "prefill_gpus_per_replica", sla.prefill_gpus_per_replica);
        readNumber(j, "decode_gpus_per_replica", sla.decode_gpus_per_replica);
        readString(j, "predictor", sla.predictor);
        readNumber(j, "ar_order", sla.predictor_options.ar_order);
        readNumber(j, "season_length", sla.predictor_options.season_length);
        readNumber(j, "correction_alpha", sla.correction_alpha);
        if (j.contains("dry_run") && j["dry_run"].is_boolean()) {
            sla.dry_run = j["dry_run"].get<bool>();
        }
        readNumber(j, "window_size", cfg.window_size);
        readString(j, "profile", cfg.profile_path);
        readString(j, "prometheus_url", cfg.prometheus_url);
        readString(j, "connector", cfg.connector);
        readString(j, "orchestrator_url", cfg.orchestrator_url);
        readString(j, "deployment", cfg.deployment);
        readString(j, "namespace", cfg.k8s_namespace);
        if (j.contains("queries") && j["queries"].is_object()) {
            const auto& q = j["queries"];
            readString(q, "request_count", cfg.queries.request_count);
            readString(q, "input_len", cfg.queries.input_len);
            readString(q, "output_len", cfg.queries.output_len);
            readString(q, "ttft_ms", cfg.queries.ttft_ms);
            readString(q, "itl_ms", cfg.queries.itl_ms);
        }
    }

    int64_t interval = sla.adjustment_interval.count();
    if (envPositive("KVPLANE_ADJUSTMENT_INTERVAL_SECS", interval, log)) {
        sla.adjustment_interval = std::chrono::seconds(interval);
        used_env = true;
    }
    used_env |= envPositive("KVPLANE_GPU_BUDGET", sla.gpu_budget, log);
    used_env |= envDouble("KVPLANE_TTFT_MS", sla.ttft_sla_ms, false, log);
    used_env |= envDouble("KVPLANE_ITL_MS", sla.itl_sla_ms, false, log);
    used_env |= envString("KVPLANE_PREDICTOR", sla.predictor, log);
    used_env |= envString("KVPLANE_PROFILE", cfg.profile_path, log);
    used_env |= envString("KVPLANE_PROMETHEUS_URL", cfg.prometheus_url, log);
    used_env |= envString("KVPLANE_CONNECTOR", cfg.connector, log);
    used_env |= envString("KVPLANE_ORCHESTRATOR_URL", cfg.orchestrator_url, log);

    if (cfg.window_size == 0) cfg.window_size = 50;
    return {cfg, finishLog(log, used_env, used_file)};
}

PlannerConfig loadPlannerConfig(const std::string& path) {
    return loadPlannerConfigWithLog(path).first;
}

}  // namespace kvplane
