#pragma once

#include "goalflow/core/constants.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/reflection/evaluation.hpp"

#include <span>

namespace goalflow {

struct ReflectionCriteria {
  double min_success_rate{reflection_defaults::kMinSuccessRate};
  double max_execution_time_multiplier{
      reflection_defaults::kMaxExecutionTimeMultiplier};
  bool require_all_tasks_complete{true};
  bool check_output_quality{true};
};

// Stateless judge of task and plan outcomes. Never mutates its inputs.
class OutcomeEvaluator {
public:
  explicit OutcomeEvaluator(ReflectionCriteria criteria = {})
      : criteria_(criteria) {}

  [[nodiscard]] auto evaluate_task(const Task &task,
                                   const TaskResult &result) const
      -> Evaluation;

  // `results` may hold several entries per task (retries, replans); the last
  // one for each task counts. Results of tasks no longer in the plan are
  // ignored.
  [[nodiscard]] auto evaluate_plan(const Plan &plan,
                                   std::span<const TaskResult> results) const
      -> Evaluation;

  [[nodiscard]] auto criteria() const noexcept -> const ReflectionCriteria & {
    return criteria_;
  }

private:
  ReflectionCriteria criteria_;
};

} // namespace goalflow
