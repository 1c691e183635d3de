#pragma once

#include "goalflow/core/error.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/reflection/evaluation.hpp"

#include <span>
#include <string>
#include <vector>

namespace goalflow {

struct FailureContext {
  TaskId failed_task;
  std::string error;
  Evaluation evaluation;
  // Every result produced so far, in execution order.
  std::vector<TaskResult> results;
  // 1-based number of this replanning attempt.
  int attempt{1};
};

// Boundary to whatever produces plans (typically a language model). The
// engine validates and owns the returned task lists.
class IPlanner {
public:
  virtual ~IPlanner() = default;

  // An empty list means no plan could be produced.
  [[nodiscard]] virtual auto
  generate_plan(const Goal &goal, std::span<const std::string> capabilities)
      -> Result<std::vector<Task>> = 0;

  // Replacement for the failed task and whatever has not run yet. An empty
  // list or an error keeps the current plan.
  [[nodiscard]] virtual auto revise_plan(const Plan &plan,
                                         const FailureContext &context)
      -> Result<std::vector<Task>> = 0;
};

} // namespace goalflow
