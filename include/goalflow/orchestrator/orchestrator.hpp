#pragma once

#include "goalflow/config/engine_config.hpp"
#include "goalflow/core/error.hpp"
#include "goalflow/executor/capability.hpp"
#include "goalflow/orchestrator/hooks.hpp"
#include "goalflow/orchestrator/options.hpp"
#include "goalflow/orchestrator/planner.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/reflection/evaluation.hpp"
#include "goalflow/reflection/evaluator.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace goalflow {

class EpisodeLearner;
class PlanGraph;

struct GoalReport {
  Goal goal;
  Plan plan;
  // Every attempt in execution order, superseded ones included.
  std::vector<TaskResult> results;
  bool success{false};
  int replanning_attempts{0};
  bool awaiting_approval{false};
  std::optional<Evaluation> plan_evaluation;
  std::vector<Evaluation> task_evaluations;
  std::optional<EpisodeId> episode_id;
  // Set when execution stopped on a stuck plan or an invalid revision.
  std::error_code fatal_error;
  std::string fatal_detail;
  std::vector<TaskId> blocked_tasks;
};

// Drives one goal from plan generation to the final report. Each call to
// execute_goal() owns its own executor, released before it returns.
class GoalOrchestrator {
public:
  GoalOrchestrator(IPlanner &planner, ICapabilityInvoker &invoker,
                   EngineConfig config = {}, EngineHooks hooks = {},
                   EpisodeLearner *learner = nullptr);

  GoalOrchestrator(const GoalOrchestrator &) = delete;
  auto operator=(const GoalOrchestrator &) -> GoalOrchestrator & = delete;

  // Fails only when no valid plan could be obtained: planner error,
  // PlanUnavailable, or a structural error in the initial plan. Everything
  // after that is described by the report.
  [[nodiscard]] auto execute_goal(const Goal &goal, TrustLevel trust,
                                  std::string *diagnostic = nullptr)
      -> Result<GoalReport>;
  [[nodiscard]] auto execute_goal(const Goal &goal,
                                  std::string *diagnostic = nullptr)
      -> Result<GoalReport> {
    return execute_goal(goal, config_.orchestrator.trust_level, diagnostic);
  }

  // Honored between waves; tasks that have not started are cancelled.
  auto request_cancel() noexcept -> void {
    cancel_requested_.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto cancel_requested() const noexcept -> bool {
    return cancel_requested_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto config() const noexcept -> const EngineConfig & {
    return config_;
  }

private:
  auto run_waves(PlanGraph &graph, const Goal &goal, GoalReport &report)
      -> void;
  [[nodiscard]] auto try_replan(PlanGraph &graph, const Task &failed,
                                const TaskResult &result,
                                const Evaluation &evaluation,
                                GoalReport &report) -> bool;
  auto finalize(PlanGraph &graph, const Goal &goal, GoalReport &report)
      -> void;

  IPlanner &planner_;
  ICapabilityInvoker &invoker_;
  EngineConfig config_;
  EngineHooks hooks_;
  EpisodeLearner *learner_;
  OutcomeEvaluator evaluator_;
  std::atomic<bool> cancel_requested_{false};
};

} // namespace goalflow
