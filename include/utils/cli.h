#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kvplane {

/// Subcommand types for the kvplane CLI
enum class Subcommand {
    None,
    Planner,  // planner [--config PATH] [--dry-run] [--once]
    Plan,     // plan --requests N --isl N --osl N --profile PATH
    Replay,   // replay --events PATH --tokens CSV
};

/// Options for the planner loop
struct PlannerOptions {
    std::string config_path;
    bool dry_run{false};
    bool once{false};
    /// Serve Prometheus text on this port (0 = off).
    uint16_t metrics_port{0};
};

/// Options for a one-shot capacity plan
struct PlanOptions {
    double requests{0.0};
    double isl{0.0};
    double osl{0.0};
    std::string profile;
    double interval_secs{180.0};
    double itl_ms{50.0};
    uint32_t gpu_budget{0};
    uint32_t min_replicas{1};
    uint32_t prefill_gpus{1};
    uint32_t decode_gpus{1};
};

/// Options for replaying KV events and routing one sequence
struct ReplayOptions {
    std::string events_path;
    std::vector<uint32_t> tokens;
    uint32_t block_size{16};
    std::string workers_path;
    double temperature{0.0};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    PlannerOptions planner_options;
    PlanOptions plan_options;
    ReplayOptions replay_options;
};

/// Parse command line arguments
CliResult parseCliArgs(int argc, char* argv[]);

/// Parse "1,2,3" into token ids. Throws std::invalid_argument on bad input.
std::vector<uint32_t> parseTokenList(const std::string& csv);

std::string getHelpMessage();
std::string getVersionMessage();

std::string subcommandToString(Subcommand cmd);

}  // namespace kvplane
