#include "goalflow/config/config.hpp"
#include "goalflow/config/toml_util.hpp"

#include "goalflow/util/file.hpp"
#include "goalflow/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace goalflow {
namespace detail {

struct ExecutorToml {
  std::int64_t max_workers{executor_defaults::kMaxWorkers};
  std::int64_t task_timeout_sec{executor_defaults::kTaskTimeout.count()};
  std::int64_t max_memory_mb{executor_defaults::kMaxMemoryMb};
  double max_cpu_percent{executor_defaults::kMaxCpuPercent};
};

struct OrchestratorToml {
  std::string trust_level{"balanced"};
  std::int64_t max_concurrent_tasks{orchestrator_defaults::kMaxConcurrentTasks};
  int max_replanning_attempts{orchestrator_defaults::kMaxReplanningAttempts};
  int max_retries{orchestrator_defaults::kMaxRetries};
  std::int64_t retry_delay_ms{orchestrator_defaults::kRetryDelay.count()};
  bool enable_reflection{true};
};

struct ReflectionToml {
  double min_success_rate{reflection_defaults::kMinSuccessRate};
  double max_execution_time_multiplier{
      reflection_defaults::kMaxExecutionTimeMultiplier};
  bool require_all_tasks_complete{true};
  bool check_output_quality{true};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct EngineToml {
  ExecutorToml executor{};
  OrchestratorToml orchestrator{};
  ReflectionToml reflection{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace goalflow

namespace glz {
template <> struct meta<goalflow::detail::ExecutorToml> {
  using T = goalflow::detail::ExecutorToml;
  static constexpr auto value =
      object("max_workers", &T::max_workers, "task_timeout_sec",
             &T::task_timeout_sec, "max_memory_mb", &T::max_memory_mb,
             "max_cpu_percent", &T::max_cpu_percent);
};

template <> struct meta<goalflow::detail::OrchestratorToml> {
  using T = goalflow::detail::OrchestratorToml;
  static constexpr auto value = object(
      "trust_level", &T::trust_level, "max_concurrent_tasks",
      &T::max_concurrent_tasks, "max_replanning_attempts",
      &T::max_replanning_attempts, "max_retries", &T::max_retries,
      "retry_delay_ms", &T::retry_delay_ms, "enable_reflection",
      &T::enable_reflection);
};

template <> struct meta<goalflow::detail::ReflectionToml> {
  using T = goalflow::detail::ReflectionToml;
  static constexpr auto value =
      object("min_success_rate", &T::min_success_rate,
             "max_execution_time_multiplier",
             &T::max_execution_time_multiplier, "require_all_tasks_complete",
             &T::require_all_tasks_complete, "check_output_quality",
             &T::check_output_quality);
};

template <> struct meta<goalflow::detail::LoggingToml> {
  using T = goalflow::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<goalflow::detail::EngineToml> {
  using T = goalflow::detail::EngineToml;
  static constexpr auto value =
      object("executor", &T::executor, "orchestrator", &T::orchestrator,
             "reflection", &T::reflection, "logging", &T::logging);
};
} // namespace glz

namespace goalflow {
namespace {

[[nodiscard]] auto env_flag(const char *v) -> bool {
  const std::string_view s(v);
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

auto set_diagnostic(std::string *diagnostic, std::string message) -> void {
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

auto apply_env_overrides(detail::EngineToml &raw) -> void {
  if (const char *v = std::getenv("GOALFLOW_MAX_WORKERS"); v != nullptr) {
    raw.executor.max_workers = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_TASK_TIMEOUT_SEC"); v != nullptr) {
    raw.executor.task_timeout_sec = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_TRUST_LEVEL"); v != nullptr) {
    raw.orchestrator.trust_level = v;
  }
  if (const char *v = std::getenv("GOALFLOW_MAX_CONCURRENT_TASKS");
      v != nullptr) {
    raw.orchestrator.max_concurrent_tasks =
        boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_MAX_REPLANNING_ATTEMPTS");
      v != nullptr) {
    raw.orchestrator.max_replanning_attempts = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_MAX_RETRIES"); v != nullptr) {
    raw.orchestrator.max_retries = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_RETRY_DELAY_MS"); v != nullptr) {
    raw.orchestrator.retry_delay_ms = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_ENABLE_REFLECTION");
      v != nullptr) {
    raw.orchestrator.enable_reflection = env_flag(v);
  }
  if (const char *v = std::getenv("GOALFLOW_MIN_SUCCESS_RATE"); v != nullptr) {
    raw.reflection.min_success_rate = boost::lexical_cast<double>(v);
  }
  if (const char *v = std::getenv("GOALFLOW_LOG_LEVEL"); v != nullptr) {
    raw.logging.level = v;
  }
  if (const char *v = std::getenv("GOALFLOW_LOG_FILE"); v != nullptr) {
    raw.logging.file = v;
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw_result =
      toml_util::parse_toml<detail::EngineToml>(toml_text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  if (raw.executor.max_workers <= 0 || raw.executor.task_timeout_sec <= 0 ||
      raw.executor.max_memory_mb < 0 ||
      raw.orchestrator.max_concurrent_tasks <= 0 ||
      raw.orchestrator.retry_delay_ms < 0) {
    set_diagnostic(diagnostic,
                   "worker, timeout and concurrency settings must be positive");
    return fail(Error::ParseError);
  }

  EngineConfig cfg{};
  cfg.executor.max_workers =
      static_cast<std::size_t>(raw.executor.max_workers);
  cfg.executor.default_timeout =
      std::chrono::seconds(raw.executor.task_timeout_sec);
  cfg.executor.max_memory_mb =
      static_cast<std::size_t>(raw.executor.max_memory_mb);
  cfg.executor.max_cpu_percent = raw.executor.max_cpu_percent;

  if (!util::try_parse_enum(raw.orchestrator.trust_level,
                            cfg.orchestrator.trust_level)) {
    set_diagnostic(diagnostic, std::format("unknown trust_level '{}'",
                                           raw.orchestrator.trust_level));
    return fail(Error::ParseError);
  }
  cfg.orchestrator.max_concurrent_tasks =
      static_cast<std::size_t>(raw.orchestrator.max_concurrent_tasks);
  cfg.orchestrator.max_replanning_attempts =
      raw.orchestrator.max_replanning_attempts;
  cfg.orchestrator.retry.max_retries = raw.orchestrator.max_retries;
  cfg.orchestrator.retry.retry_delay =
      std::chrono::milliseconds(raw.orchestrator.retry_delay_ms);
  cfg.orchestrator.enable_reflection = raw.orchestrator.enable_reflection;

  cfg.reflection.min_success_rate = raw.reflection.min_success_rate;
  cfg.reflection.max_execution_time_multiplier =
      raw.reflection.max_execution_time_multiplier;
  cfg.reflection.require_all_tasks_complete =
      raw.reflection.require_all_tasks_complete;
  cfg.reflection.check_output_quality = raw.reflection.check_output_quality;

  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  if (auto valid = ConfigLoader::validate(cfg, diagnostic); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const EngineConfig &config,
                            std::string *diagnostic) -> Result<void> {
  if (config.executor.max_workers == 0 ||
      config.executor.default_timeout <= std::chrono::milliseconds::zero()) {
    set_diagnostic(diagnostic, "executor needs at least one worker and a "
                               "positive task timeout");
    return fail(Error::ParseError);
  }
  if (config.orchestrator.max_concurrent_tasks == 0) {
    set_diagnostic(diagnostic, "max_concurrent_tasks must be positive");
    return fail(Error::ParseError);
  }
  if (config.orchestrator.max_replanning_attempts < 0 ||
      config.orchestrator.retry.max_retries < 0) {
    set_diagnostic(diagnostic,
                   "replanning attempts and retries cannot be negative");
    return fail(Error::ParseError);
  }
  if (config.reflection.min_success_rate < 0.0 ||
      config.reflection.min_success_rate > 1.0) {
    set_diagnostic(diagnostic, "min_success_rate must lie in [0, 1]");
    return fail(Error::ParseError);
  }
  if (config.reflection.max_execution_time_multiplier <= 0.0) {
    set_diagnostic(diagnostic,
                   "max_execution_time_multiplier must be positive");
    return fail(Error::ParseError);
  }
  if (!log::parse_level(config.logging.level)) {
    set_diagnostic(diagnostic,
                   std::format("unknown log level '{}'", config.logging.level));
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path,
                                  std::string *diagnostic)
    -> Result<EngineConfig> {
  auto text = util::read_file(path);
  if (!text) {
    set_diagnostic(diagnostic, std::format("cannot read {}", path));
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid GOALFLOW_* environment override: {}", e.what());
    set_diagnostic(diagnostic,
                   std::format("invalid environment override: {}", e.what()));
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML engine configuration: {}", e.what());
    set_diagnostic(diagnostic, e.what());
    return fail(Error::ParseError);
  }
}

auto apply_logging(const LoggingConfig &config) -> Result<void> {
  auto level = log::parse_level(config.level);
  if (!level) {
    return fail(Error::InvalidArgument);
  }
  log::set_level(*level);
  if (config.file.empty()) {
    log::set_output_stderr();
    return ok();
  }
  if (!log::set_output_file(config.file)) {
    return fail(Error::FileNotFound);
  }
  return ok();
}

} // namespace goalflow
