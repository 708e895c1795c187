// logger.h - spdlog setup shared by the router and planner processes
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace kvplane::logger {

/// Logging knobs resolved from the environment.
struct LogSettings {
    std::string level{"info"};
    std::string dir;
    int retention_days{7};
    /// Human-readable stdout sink next to the JSON file sink.
    bool console{true};
};

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// KVPLANE_LOG_DIR, else ~/.kvplane/logs.
std::string get_log_dir();

// <log dir>/kvplane.jsonl.YYYY-MM-DD for today.
std::string get_log_file_path();

// KVPLANE_LOG_RETENTION_DAYS within [1, 365), else 7.
int get_retention_days();

// Remove kvplane.jsonl.* files dated before today - retention_days.
// Other files in the directory are left alone.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

LogSettings settings_from_env();

// Install the default "kvplane" logger. additional_sinks replace the
// file sink when given (tests inject an ostream sink this way).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Stdout + daily JSON-lines file, after pruning expired files.
void init(const LogSettings& settings);

// init(settings_from_env())
void init_from_env();

}  // namespace kvplane::logger
