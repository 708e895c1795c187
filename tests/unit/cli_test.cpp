#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/cli.h"
#include "utils/version.h"

using namespace kvplane;

namespace {

CliResult parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parseCliArgs(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(CliTest, NoArgumentsShowsHelpAndFails) {
    CliResult result = parse({"kvplane"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("COMMANDS"), std::string::npos);
}

TEST(CliTest, HelpFlagShowsHelpMessage) {
    for (const char* flag : {"--help", "-h"}) {
        CliResult result = parse({"kvplane", flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find("kvplane"), std::string::npos);
        EXPECT_NE(result.output.find("planner"), std::string::npos);
    }
}

TEST(CliTest, VersionFlagShowsVersion) {
    for (const char* flag : {"--version", "-V"}) {
        CliResult result = parse({"kvplane", flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find(KVPLANE_VERSION), std::string::npos);
    }
}

TEST(CliTest, UnknownCommandFails) {
    CliResult result = parse({"kvplane", "serve"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Unknown command: serve"), std::string::npos);

    result = parse({"kvplane", "--verbose"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Unknown option: --verbose"), std::string::npos);
}

TEST(CliTest, PlannerOptions) {
    CliResult result = parse({"kvplane", "planner", "--config", "/etc/kvplane.json", "--dry-run", "--once",
                              "--metrics-port", "9400"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Planner);
    EXPECT_EQ(result.planner_options.config_path, "/etc/kvplane.json");
    EXPECT_TRUE(result.planner_options.dry_run);
    EXPECT_TRUE(result.planner_options.once);
    EXPECT_EQ(result.planner_options.metrics_port, 9400);
}

TEST(CliTest, PlannerHelp) {
    CliResult result = parse({"kvplane", "planner", "--help"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("KVPLANE_GPU_BUDGET"), std::string::npos);
}

TEST(CliTest, PlannerRejectsUnknownOption) {
    CliResult result = parse({"kvplane", "planner", "--fast"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Error: unknown option --fast"), std::string::npos);
}

TEST(CliTest, PlanOptions) {
    CliResult result = parse({"kvplane", "plan", "--requests", "180", "--isl", "3000", "--osl", "150",
                              "--profile", "profile.json", "--gpu-budget", "8", "--itl-ms", "40"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Plan);
    EXPECT_DOUBLE_EQ(result.plan_options.requests, 180);
    EXPECT_DOUBLE_EQ(result.plan_options.isl, 3000);
    EXPECT_DOUBLE_EQ(result.plan_options.osl, 150);
    EXPECT_EQ(result.plan_options.profile, "profile.json");
    EXPECT_EQ(result.plan_options.gpu_budget, 8u);
    EXPECT_DOUBLE_EQ(result.plan_options.itl_ms, 40);
    EXPECT_DOUBLE_EQ(result.plan_options.interval_secs, 180);
    EXPECT_EQ(result.plan_options.min_replicas, 1u);
}

TEST(CliTest, PlanRequiresTrafficAndProfile) {
    CliResult result = parse({"kvplane", "plan", "--requests", "10", "--profile", "p.json"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("--requests, --isl and --osl are required"), std::string::npos);

    result = parse({"kvplane", "plan", "--requests", "10", "--isl", "1", "--osl", "1"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("--profile is required"), std::string::npos);
}

TEST(CliTest, PlanRejectsBadNumbers) {
    CliResult result = parse({"kvplane", "plan", "--requests", "lots", "--isl", "1", "--osl", "1"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("invalid number"), std::string::npos);

    result = parse({"kvplane", "plan", "--requests", "-1", "--isl", "1", "--osl", "1", "--profile", "p"});
    EXPECT_EQ(result.exit_code, 1);
}

TEST(CliTest, ReplayOptions) {
    CliResult result = parse({"kvplane", "replay", "--events", "events.jsonl", "--tokens", "1,2,3,4",
                              "--block-size", "2", "--temperature", "0.5"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Replay);
    EXPECT_EQ(result.replay_options.events_path, "events.jsonl");
    EXPECT_EQ(result.replay_options.tokens, (std::vector<uint32_t>{1, 2, 3, 4}));
    EXPECT_EQ(result.replay_options.block_size, 2u);
    EXPECT_DOUBLE_EQ(result.replay_options.temperature, 0.5);
}

TEST(CliTest, ReplayValidatesInput) {
    EXPECT_EQ(parse({"kvplane", "replay", "--tokens", "1"}).exit_code, 1);
    EXPECT_EQ(parse({"kvplane", "replay", "--events", "e"}).exit_code, 1);
    EXPECT_EQ(parse({"kvplane", "replay", "--events", "e", "--tokens", "1,x"}).exit_code, 1);
    EXPECT_EQ(parse({"kvplane", "replay", "--events", "e", "--tokens", "1", "--block-size", "0"}).exit_code, 1);
}

TEST(CliTest, ParseTokenList) {
    EXPECT_EQ(parseTokenList("5,6,,7"), (std::vector<uint32_t>{5, 6, 7}));
    EXPECT_TRUE(parseTokenList("").empty());
    EXPECT_THROW(parseTokenList("1,-2"), std::invalid_argument);
    EXPECT_THROW(parseTokenList("1,2x"), std::invalid_argument);
    EXPECT_THROW(parseTokenList("99999999999"), std::invalid_argument);
}

TEST(CliTest, SubcommandToString) {
    EXPECT_EQ(subcommandToString(Subcommand::Planner), "planner");
    EXPECT_EQ(subcommandToString(Subcommand::Plan), "plan");
    EXPECT_EQ(subcommandToString(Subcommand::Replay), "replay");
    EXPECT_EQ(subcommandToString(Subcommand::None), "none");
}
