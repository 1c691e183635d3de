#pragma once

#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/enum.hpp"
#include "goalflow/util/id.hpp"
#include "goalflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace goalflow {

enum class FailureCategory : std::uint8_t {
  Timeout,
  Permission,
  NotFound,
  Network,
  Validation,
  Resource,
  Execution,
};
BOOST_DESCRIBE_ENUM(FailureCategory, Timeout, Permission, NotFound, Network,
                    Validation, Resource, Execution)
GOALFLOW_DEFINE_ENUM_SERDE(FailureCategory, FailureCategory::Execution)

enum class PatternKind : std::uint8_t {
  RepeatedErrors,
  SequentialFailures,
  ToolFailure,
};
BOOST_DESCRIBE_ENUM(PatternKind, RepeatedErrors, SequentialFailures,
                    ToolFailure)
GOALFLOW_DEFINE_ENUM_SERDE(PatternKind, PatternKind::RepeatedErrors)

struct FailurePattern {
  PatternKind kind{PatternKind::RepeatedErrors};
  std::string description;
  std::size_t occurrences{0};
  std::vector<TaskId> tasks;
  // Set for repeated_errors.
  std::optional<FailureCategory> category;
  // Set for tool_failure.
  std::string capability;
};

// Verdict on a single task result (task_id set) or on a whole plan
// (plan_id set).
struct Evaluation {
  std::optional<TaskId> task_id;
  std::optional<PlanId> plan_id;
  bool success{false};
  double confidence{0.0};
  std::vector<std::string> issues;
  std::vector<std::string> suggestions;
  bool should_replan{false};
  std::optional<FailureCategory> category;
  std::vector<FailurePattern> patterns;
  double success_rate{0.0};
  util::TimePoint created_at{};
};

// Everything one goal execution produced, kept for later learning.
struct Episode {
  EpisodeId id;
  Goal goal;
  Plan plan;
  std::vector<TaskResult> results;
  bool success{false};
  int replanning_attempts{0};
  util::TimePoint created_at{};
};

} // namespace goalflow
