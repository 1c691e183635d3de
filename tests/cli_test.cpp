#include "goalflow/cli/commands.hpp"
#include "goalflow/cli/formatting.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

#include "gtest/gtest.h"

using namespace goalflow;
using namespace goalflow::cli;

namespace {

class CLICommandTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           std::format("goalflow_cli_test_{}",
                       ::testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name());
    std::filesystem::create_directories(dir_);
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  auto write(std::string_view name, std::string_view content) -> std::string {
    auto path = dir_ / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }

  std::filesystem::path dir_;
};

constexpr std::string_view kChainPlan = R"({
  "goal": "fetch and summarize",
  "tasks": [
    {"id": "fetch", "capability": "http_get", "params": {"url": "x"}},
    {"id": "parse", "capability": "parse", "dependencies": ["fetch"]},
    {"id": "report", "capability": "write", "dependencies": ["parse"]}
  ]
})";

constexpr std::string_view kFailingPlan = R"({
  "goal": "fetch",
  "tasks": [
    {"id": "fetch", "capability": "http_get",
     "params": {"simulate_error": "Connection refused"}},
    {"id": "parse", "capability": "parse", "dependencies": ["fetch"]}
  ]
})";

constexpr std::string_view kRevision = R"({
  "tasks": [
    {"id": "fetch_mirror", "capability": "http_get"},
    {"id": "parse", "capability": "parse", "dependencies": ["fetch_mirror"]}
  ]
})";

constexpr std::string_view kCyclicPlan = R"({
  "tasks": [
    {"id": "a", "capability": "x", "dependencies": ["b"]},
    {"id": "b", "capability": "x", "dependencies": ["a"]}
  ]
})";

} // namespace

TEST(CLITest, ValidateOptionsDefaults) {
  ValidateOptions opts;
  EXPECT_TRUE(opts.plan_file.empty());
  EXPECT_FALSE(opts.json);
}

TEST(CLITest, SimulateOptionsDefaults) {
  SimulateOptions opts;
  EXPECT_TRUE(opts.plan_file.empty());
  EXPECT_TRUE(opts.config_file.empty());
  EXPECT_FALSE(opts.revision_file.has_value());
  EXPECT_FALSE(opts.trust_level.has_value());
  EXPECT_FALSE(opts.log_level.has_value());
  EXPECT_FALSE(opts.json);
}

TEST(CLITest, FormatDuration) {
  EXPECT_EQ(fmt::format_duration(0.25), "250ms");
  EXPECT_EQ(fmt::format_duration(2.5), "2.50s");
  EXPECT_EQ(fmt::format_duration(125.0), "2m 5s");
}

TEST(CLITest, VisibleWidthIgnoresAnsiCodes) {
  EXPECT_EQ(fmt::ansi::ansi_visible_width("\033[32mok\033[0m"), 2);
  EXPECT_EQ(fmt::ansi::ansi_visible_width("plain"), 5);
}

TEST_F(CLICommandTest, ValidateAcceptsWellFormedPlan) {
  auto plan = write("plan.json", kChainPlan);
  EXPECT_EQ(cmd_validate({.plan_file = plan, .json = false}), 0);
  EXPECT_EQ(cmd_validate({.plan_file = plan, .json = true}), 0);
}

TEST_F(CLICommandTest, ValidateRejectsCycle) {
  auto plan = write("cycle.json", kCyclicPlan);
  EXPECT_EQ(cmd_validate({.plan_file = plan, .json = false}), 1);
  EXPECT_EQ(cmd_validate({.plan_file = plan, .json = true}), 1);
}

TEST_F(CLICommandTest, ValidateRejectsMissingOrEmptyPlan) {
  EXPECT_EQ(cmd_validate({.plan_file = (dir_ / "nope.json").string(),
                          .json = false}),
            1);
  auto empty = write("empty.json", R"({"tasks": []})");
  EXPECT_EQ(cmd_validate({.plan_file = empty, .json = false}), 1);
  auto broken = write("broken.json", "{ not json");
  EXPECT_EQ(cmd_validate({.plan_file = broken, .json = true}), 1);
}

TEST_F(CLICommandTest, SimulateSucceeds) {
  SimulateOptions opts;
  opts.plan_file = write("plan.json", kChainPlan);
  opts.json = true;
  EXPECT_EQ(cmd_simulate(opts), 0);
}

TEST_F(CLICommandTest, SimulateReportsFailure) {
  SimulateOptions opts;
  opts.plan_file = write("plan.json", kFailingPlan);
  EXPECT_EQ(cmd_simulate(opts), 1);
}

TEST_F(CLICommandTest, SimulateRecoversWithRevision) {
  SimulateOptions opts;
  opts.plan_file = write("plan.json", kFailingPlan);
  opts.revision_file = write("revision.json", kRevision);
  opts.json = true;
  EXPECT_EQ(cmd_simulate(opts), 0);
}

TEST_F(CLICommandTest, SimulateParanoidOnlyPlans) {
  SimulateOptions opts;
  opts.plan_file = write("plan.json", kFailingPlan);
  opts.trust_level = "paranoid";
  EXPECT_EQ(cmd_simulate(opts), 0);
}

TEST_F(CLICommandTest, SimulateUsesConfigFile) {
  SimulateOptions opts;
  opts.plan_file = write("plan.json", kFailingPlan);
  opts.revision_file = write("revision.json", kRevision);
  opts.config_file = write("engine.toml", R"(
[orchestrator]
max_replanning_attempts = 0

[logging]
level = "error"
)");
  // No replanning budget, so the revision is never requested.
  EXPECT_EQ(cmd_simulate(opts), 1);
}

TEST_F(CLICommandTest, SimulateRejectsBadInputs) {
  SimulateOptions cyclic;
  cyclic.plan_file = write("cycle.json", kCyclicPlan);
  EXPECT_EQ(cmd_simulate(cyclic), 1);

  SimulateOptions bad_trust;
  bad_trust.plan_file = write("plan.json", kChainPlan);
  bad_trust.trust_level = "reckless";
  EXPECT_EQ(cmd_simulate(bad_trust), 1);

  SimulateOptions bad_config;
  bad_config.plan_file = write("plan2.json", kChainPlan);
  bad_config.config_file = write("bad.toml", "[orchestrator]\n"
                                             "trust_level = \"nope\"\n");
  EXPECT_EQ(cmd_simulate(bad_config), 1);
}
