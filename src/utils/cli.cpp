#include "utils/cli.h"
#include "utils/version.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace kvplane {

std::string getPlannerHelpMessage();
std::string getPlanHelpMessage();
std::string getReplayHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "kvplane " << KVPLANE_VERSION << " - KV-cache-aware routing and SLA capacity planning\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    kvplane <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    planner    Run the SLA planner loop\n";
    oss << "    plan       Compute one replica plan from a throughput profile\n";
    oss << "    replay     Replay KV events and route one token sequence\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'kvplane <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getPlannerHelpMessage() {
    std::ostringstream oss;
    oss << "kvplane planner - Run the SLA planner loop\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    kvplane planner [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --config <PATH>        Config file (default: KVPLANE_CONFIG or ~/.kvplane/config.json)\n";
    oss << "    --dry-run              Compute and log plans without scaling\n";
    oss << "    --once                 Run a single cycle and exit\n";
    oss << "    --metrics-port <PORT>  Serve Prometheus metrics on /metrics\n";
    oss << "    -h, --help             Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    KVPLANE_CONFIG                     Config file path\n";
    oss << "    KVPLANE_ADJUSTMENT_INTERVAL_SECS   Adjustment interval (default: 180)\n";
    oss << "    KVPLANE_TTFT_MS                    TTFT target in ms (default: 500)\n";
    oss << "    KVPLANE_ITL_MS                     ITL target in ms (default: 50)\n";
    oss << "    KVPLANE_GPU_BUDGET                 Total GPUs for both roles (default: 8)\n";
    oss << "    KVPLANE_PREDICTOR                  constant|autoregressive|seasonal\n";
    oss << "    KVPLANE_PROFILE                    Throughput profile JSON\n";
    oss << "    KVPLANE_PROMETHEUS_URL             Metrics source URL\n";
    oss << "    KVPLANE_CONNECTOR                  virtual|orchestration\n";
    oss << "    KVPLANE_ORCHESTRATOR_URL           Orchestration API base URL\n";
    oss << "    KVPLANE_LOG_LEVEL                  Log level (trace|debug|info|warn|error)\n";
    oss << "    KVPLANE_LOG_DIR                    Log directory (default: ~/.kvplane/logs)\n";
    oss << "    KVPLANE_LOG_RETENTION_DAYS         Log retention days (default: 7)\n";
    return oss.str();
}

std::string getPlanHelpMessage() {
    std::ostringstream oss;
    oss << "kvplane plan - Compute one replica plan\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    kvplane plan --requests <N> --isl <N> --osl <N> --profile <PATH> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --requests <N>       Requests expected in the interval\n";
    oss << "    --isl <N>            Mean input length (tokens)\n";
    oss << "    --osl <N>            Mean output length (tokens)\n";
    oss << "    --profile <PATH>     Throughput profile JSON\n";
    oss << "    --interval <SECS>    Interval length (default: 180)\n";
    oss << "    --itl-ms <MS>        ITL target (default: 50)\n";
    oss << "    --gpu-budget <N>     Total GPUs (default: unbounded)\n";
    oss << "    --min-replicas <N>   Minimum replicas per role (default: 1)\n";
    oss << "    --prefill-gpus <N>   GPUs per prefill replica (default: 1)\n";
    oss << "    --decode-gpus <N>    GPUs per decode replica (default: 1)\n";
    oss << "    -h, --help           Print help\n";
    return oss.str();
}

std::string getReplayHelpMessage() {
    std::ostringstream oss;
    oss << "kvplane replay - Replay KV events and route one token sequence\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    kvplane replay --events <PATH> --tokens <CSV> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --events <PATH>      KV events, one JSON object per line\n";
    oss << "    --tokens <CSV>       Token ids, e.g. 1,2,3\n";
    oss << "    --block-size <N>     Tokens per block (default: 16)\n";
    oss << "    --workers <PATH>     Worker list JSON (default: workers seen in events)\n";
    oss << "    --temperature <T>    Softmax temperature (default: 0)\n";
    oss << "    -h, --help           Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "kvplane " << KVPLANE_VERSION << "\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

std::vector<uint32_t> parseTokenList(const std::string& csv) {
    std::vector<uint32_t> tokens;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        size_t consumed = 0;
        long long v = std::stoll(item, &consumed);
        if (consumed != item.size() || v < 0 || v > 0xFFFFFFFFLL) {
            throw std::invalid_argument("bad token id: " + item);
        }
        tokens.push_back(static_cast<uint32_t>(v));
    }
    return tokens;
}

namespace {

CliResult usageError(CliResult result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "planner") == 0) {
        result.subcommand = Subcommand::Planner;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getPlannerHelpMessage();
            return result;
        }

        try {
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                    result.planner_options.config_path = argv[++i];
                } else if (std::strcmp(argv[i], "--dry-run") == 0) {
                    result.planner_options.dry_run = true;
                } else if (std::strcmp(argv[i], "--once") == 0) {
                    result.planner_options.once = true;
                } else if (std::strcmp(argv[i], "--metrics-port") == 0 && i + 1 < argc) {
                    result.planner_options.metrics_port = static_cast<uint16_t>(std::stoi(argv[++i]));
                } else {
                    return usageError(result, std::string("unknown option ") + argv[i], "kvplane planner [OPTIONS]");
                }
            }
        } catch (const std::exception&) {
            return usageError(result, "invalid number", "kvplane planner [OPTIONS]");
        }
        return result;
    }

    if (std::strcmp(command, "plan") == 0) {
        result.subcommand = Subcommand::Plan;
        const std::string usage = "kvplane plan --requests <N> --isl <N> --osl <N> --profile <PATH>";

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getPlanHelpMessage();
            return result;
        }

        auto& opts = result.plan_options;
        bool has_requests = false, has_isl = false, has_osl = false;
        try {
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--requests") == 0 && i + 1 < argc) {
                    opts.requests = std::stod(argv[++i]);
                    has_requests = true;
                } else if (std::strcmp(argv[i], "--isl") == 0 && i + 1 < argc) {
                    opts.isl = std::stod(argv[++i]);
                    has_isl = true;
                } else if (std::strcmp(argv[i], "--osl") == 0 && i + 1 < argc) {
                    opts.osl = std::stod(argv[++i]);
                    has_osl = true;
                } else if (std::strcmp(argv[i], "--profile") == 0 && i + 1 < argc) {
                    opts.profile = argv[++i];
                } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
                    opts.interval_secs = std::stod(argv[++i]);
                } else if (std::strcmp(argv[i], "--itl-ms") == 0 && i + 1 < argc) {
                    opts.itl_ms = std::stod(argv[++i]);
                } else if (std::strcmp(argv[i], "--gpu-budget") == 0 && i + 1 < argc) {
                    opts.gpu_budget = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (std::strcmp(argv[i], "--min-replicas") == 0 && i + 1 < argc) {
                    opts.min_replicas = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (std::strcmp(argv[i], "--prefill-gpus") == 0 && i + 1 < argc) {
                    opts.prefill_gpus = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (std::strcmp(argv[i], "--decode-gpus") == 0 && i + 1 < argc) {
                    opts.decode_gpus = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else {
                    return usageError(result, std::string("unknown option ") + argv[i], usage);
                }
            }
        } catch (const std::exception&) {
            return usageError(result, "invalid number", usage);
        }

        if (!has_requests || !has_isl || !has_osl) {
            return usageError(result, "--requests, --isl and --osl are required", usage);
        }
        if (opts.requests < 0 || opts.isl < 0 || opts.osl < 0 || opts.interval_secs <= 0) {
            return usageError(result, "values must be non-negative", usage);
        }
        if (opts.profile.empty()) {
            return usageError(result, "--profile is required", usage);
        }
        return result;
    }

    if (std::strcmp(command, "replay") == 0) {
        result.subcommand = Subcommand::Replay;
        const std::string usage = "kvplane replay --events <PATH> --tokens <CSV>";

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getReplayHelpMessage();
            return result;
        }

        auto& opts = result.replay_options;
        bool has_tokens = false;
        try {
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--events") == 0 && i + 1 < argc) {
                    opts.events_path = argv[++i];
                } else if (std::strcmp(argv[i], "--tokens") == 0 && i + 1 < argc) {
                    opts.tokens = parseTokenList(argv[++i]);
                    has_tokens = true;
                } else if (std::strcmp(argv[i], "--block-size") == 0 && i + 1 < argc) {
                    opts.block_size = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
                    opts.workers_path = argv[++i];
                } else if (std::strcmp(argv[i], "--temperature") == 0 && i + 1 < argc) {
                    opts.temperature = std::stod(argv[++i]);
                } else {
                    return usageError(result, std::string("unknown option ") + argv[i], usage);
                }
            }
        } catch (const std::exception&) {
            return usageError(result, "invalid value", usage);
        }

        if (opts.events_path.empty()) {
            return usageError(result, "--events is required", usage);
        }
        if (!has_tokens) {
            return usageError(result, "--tokens is required", usage);
        }
        if (opts.block_size == 0) {
            return usageError(result, "--block-size must be positive", usage);
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Planner: return "planner";
        case Subcommand::Plan: return "plan";
        case Subcommand::Replay: return "replay";
        default: return "unknown";
    }
}

}  // namespace kvplane
