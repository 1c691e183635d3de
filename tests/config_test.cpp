#include "goalflow/config/config.hpp"
#include "goalflow/util/log.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "gtest/gtest.h"

using namespace goalflow;
using namespace std::chrono_literals;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name); old != nullptr) {
      previous_ = old;
    }
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_, previous_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }
  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
  std::optional<std::string> previous_;
};

} // namespace

TEST(ConfigTest, EngineDefaults) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.executor.max_workers, 4);
  EXPECT_EQ(cfg.executor.default_timeout, 300s);
  EXPECT_EQ(cfg.orchestrator.trust_level, TrustLevel::Balanced);
  EXPECT_EQ(cfg.orchestrator.max_concurrent_tasks, 4);
  EXPECT_EQ(cfg.orchestrator.max_replanning_attempts, 3);
  EXPECT_EQ(cfg.orchestrator.retry.max_retries, 0);
  EXPECT_TRUE(cfg.orchestrator.enable_reflection);
  EXPECT_DOUBLE_EQ(cfg.reflection.min_success_rate, 0.8);
  EXPECT_DOUBLE_EQ(cfg.reflection.max_execution_time_multiplier, 2.0);
  EXPECT_EQ(cfg.logging.level, "info");
  EXPECT_TRUE(cfg.logging.file.empty());
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->executor.max_workers, 4);
  EXPECT_EQ(result->orchestrator.trust_level, TrustLevel::Balanced);
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[executor]
max_workers = 8
task_timeout_sec = 30
max_memory_mb = 2048
max_cpu_percent = 50.0

[orchestrator]
trust_level = "autonomous"
max_concurrent_tasks = 2
max_replanning_attempts = 1
max_retries = 2
retry_delay_ms = 250
enable_reflection = false

[reflection]
min_success_rate = 0.5
max_execution_time_multiplier = 3.0
require_all_tasks_complete = false
check_output_quality = false

[logging]
level = "debug"
file = "/tmp/goalflow.log"

[unrelated]
key = "ignored"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->executor.max_workers, 8);
  EXPECT_EQ(result->executor.default_timeout, 30s);
  EXPECT_EQ(result->executor.max_memory_mb, 2048);
  EXPECT_DOUBLE_EQ(result->executor.max_cpu_percent, 50.0);
  EXPECT_EQ(result->orchestrator.trust_level, TrustLevel::Autonomous);
  EXPECT_EQ(result->orchestrator.max_concurrent_tasks, 2);
  EXPECT_EQ(result->orchestrator.max_replanning_attempts, 1);
  EXPECT_EQ(result->orchestrator.retry.max_retries, 2);
  EXPECT_EQ(result->orchestrator.retry.retry_delay, 250ms);
  EXPECT_FALSE(result->orchestrator.enable_reflection);
  EXPECT_DOUBLE_EQ(result->reflection.min_success_rate, 0.5);
  EXPECT_DOUBLE_EQ(result->reflection.max_execution_time_multiplier, 3.0);
  EXPECT_FALSE(result->reflection.require_all_tasks_complete);
  EXPECT_FALSE(result->reflection.check_output_quality);
  EXPECT_EQ(result->logging.level, "debug");
  EXPECT_EQ(result->logging.file, "/tmp/goalflow.log");
}

TEST(ConfigTest, PartialSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
[orchestrator]
trust_level = "paranoid"
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->orchestrator.trust_level, TrustLevel::Paranoid);
  EXPECT_EQ(result->orchestrator.max_replanning_attempts, 3);
  EXPECT_EQ(result->executor.max_workers, 4);
}

TEST(ConfigTest, UnknownTrustLevelIsRejected) {
  std::string diagnostic;
  auto result = ConfigLoader::load_from_string(R"(
[orchestrator]
trust_level = "reckless"
)",
                                               &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_NE(diagnostic.find("reckless"), std::string::npos);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[executor]
max_workers = 0
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[orchestrator]
max_concurrent_tasks = -1
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[orchestrator]
max_replanning_attempts = -2
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[reflection]
min_success_rate = 1.5
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[reflection]
max_execution_time_multiplier = 0.0
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[logging]
level = "chatty"
)")
                   .has_value());
}

TEST(ConfigTest, MalformedTomlIsRejected) {
  std::string diagnostic;
  auto result =
      ConfigLoader::load_from_string("[executor\nmax_workers = ", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(diagnostic.empty());
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
  ScopedEnv workers("GOALFLOW_MAX_WORKERS", "16");
  ScopedEnv trust("GOALFLOW_TRUST_LEVEL", "paranoid");
  ScopedEnv reflection("GOALFLOW_ENABLE_REFLECTION", "no");
  ScopedEnv rate("GOALFLOW_MIN_SUCCESS_RATE", "0.25");
  ScopedEnv delay("GOALFLOW_RETRY_DELAY_MS", "10");
  ScopedEnv level("GOALFLOW_LOG_LEVEL", "warn");

  auto result = ConfigLoader::load_from_string(R"(
[executor]
max_workers = 2

[orchestrator]
trust_level = "autonomous"
enable_reflection = true
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->executor.max_workers, 16);
  EXPECT_EQ(result->orchestrator.trust_level, TrustLevel::Paranoid);
  EXPECT_FALSE(result->orchestrator.enable_reflection);
  EXPECT_DOUBLE_EQ(result->reflection.min_success_rate, 0.25);
  EXPECT_EQ(result->orchestrator.retry.retry_delay, 10ms);
  EXPECT_EQ(result->logging.level, "warn");
}

TEST(ConfigTest, NonNumericEnvironmentOverrideIsRejected) {
  ScopedEnv workers("GOALFLOW_MAX_WORKERS", "lots");
  std::string diagnostic;
  auto result = ConfigLoader::load_from_string("", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_NE(diagnostic.find("environment"), std::string::npos);
}

TEST(ConfigTest, LoadFromFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "goalflow_config_test.toml";
  {
    std::ofstream out(path);
    out << "[executor]\nmax_workers = 3\n";
  }
  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->executor.max_workers, 3);

  auto missing = ConfigLoader::load_from_file("/nonexistent/goalflow.toml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, ValidateRejectsHandBuiltConfig) {
  EngineConfig cfg;
  EXPECT_TRUE(ConfigLoader::validate(cfg).has_value());

  cfg.orchestrator.max_concurrent_tasks = 0;
  std::string diagnostic;
  EXPECT_FALSE(ConfigLoader::validate(cfg, &diagnostic).has_value());
  EXPECT_NE(diagnostic.find("max_concurrent_tasks"), std::string::npos);
}

TEST(ConfigTest, ApplyLogging) {
  EXPECT_FALSE(apply_logging(LoggingConfig{.level = "loud", .file = {}})
                   .has_value());
  EXPECT_TRUE(
      apply_logging(LoggingConfig{.level = "warn", .file = {}}).has_value());
  EXPECT_FALSE(apply_logging(LoggingConfig{
                                 .level = "warn",
                                 .file = "/nonexistent/dir/goalflow.log"})
                   .has_value());
  log::set_output_stderr();
  log::set_level(log::Level::Warn);
}
