#pragma once

#include "goalflow/plan/plan_types.hpp"
#include "goalflow/reflection/evaluation.hpp"

#include <functional>

namespace goalflow {

// Fire-and-forget sinks, all called from the orchestrator thread. Any of
// them may be left empty; exceptions they throw are logged and dropped.
struct EngineHooks {
  std::move_only_function<void(const Plan &plan)> on_plan_created;
  std::move_only_function<void(const Task &task)> on_task_started;
  std::move_only_function<void(const Task &task, const TaskResult &result)>
      on_task_completed;
  std::move_only_function<void(const Task &task, const TaskResult &result)>
      on_task_failed;
  std::move_only_function<void(const Evaluation &evaluation)>
      on_plan_evaluated;
  std::move_only_function<void(const Episode &episode)> on_episode_recorded;
};

} // namespace goalflow
