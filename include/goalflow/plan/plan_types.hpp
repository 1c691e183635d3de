#pragma once

#include "goalflow/util/enum.hpp"
#include "goalflow/util/id.hpp"
#include "goalflow/util/json.hpp"
#include "goalflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace goalflow {

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Running, Completed, Failed, Cancelled)
GOALFLOW_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

[[nodiscard]] constexpr bool is_terminal(TaskStatus s) noexcept {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

enum class PlanStatus : std::uint8_t {
  Draft,
  Approved,
  Executing,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(PlanStatus, Draft, Approved, Executing, Completed, Failed,
                    Cancelled)
GOALFLOW_DEFINE_ENUM_SERDE(PlanStatus, PlanStatus::Draft)

[[nodiscard]] constexpr bool is_terminal(PlanStatus s) noexcept {
  return s == PlanStatus::Completed || s == PlanStatus::Failed ||
         s == PlanStatus::Cancelled;
}

namespace task_meta {
inline constexpr std::string_view kRetries = "retries";
inline constexpr std::string_view kRetryExhausted = "retry_exhausted";
inline constexpr std::string_view kAttempts = "attempts";
inline constexpr std::string_view kTimedOut = "timed_out";
// Set with kTimedOut when the deadline passed before a worker picked it up.
inline constexpr std::string_view kNotStarted = "not_started";
inline constexpr std::string_view kCancelled = "cancelled";
inline constexpr std::string_view kExpectedTimeSeconds =
    "expected_time_seconds";
} // namespace task_meta

struct Goal {
  GoalId id;
  std::string description;
  JsonMap constraints;
  JsonMap context;
  int priority{5};
  util::TimePoint created_at{};
};

struct Task {
  TaskId id;
  PlanId plan_id;
  std::string description;
  std::string capability;
  JsonMap params;
  std::vector<TaskId> dependencies;
  TaskStatus status{TaskStatus::Pending};
  std::optional<JsonValue> output;
  std::optional<std::string> error;
  util::TimePoint started_at{};
  util::TimePoint finished_at{};
  JsonMap metadata;
};

struct Plan {
  PlanId id;
  GoalId goal_id;
  std::vector<Task> tasks;
  PlanStatus status{PlanStatus::Draft};
  util::TimePoint created_at{};
  util::TimePoint approved_at{};
  util::TimePoint started_at{};
  util::TimePoint completed_at{};
  JsonMap metadata;
};

struct TaskResult {
  TaskId task_id;
  std::string capability;
  bool success{false};
  JsonValue output{};
  std::string error;
  std::vector<std::string> logs;
  std::chrono::nanoseconds duration{0};
  util::TimePoint started_at{};
  util::TimePoint finished_at{};
  JsonMap metadata;

  [[nodiscard]] auto duration_seconds() const -> double {
    return util::to_seconds(duration);
  }
  [[nodiscard]] auto timed_out() const -> bool {
    return json_bool(metadata, task_meta::kTimedOut);
  }
  [[nodiscard]] auto cancelled() const -> bool {
    return json_bool(metadata, task_meta::kCancelled);
  }
};

[[nodiscard]] inline auto make_failed_result(TaskId task_id, std::string error)
    -> TaskResult {
  TaskResult r;
  r.task_id = std::move(task_id);
  r.success = false;
  r.error = std::move(error);
  r.started_at = util::Clock::now();
  r.finished_at = r.started_at;
  return r;
}

} // namespace goalflow
