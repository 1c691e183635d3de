#include "goalflow/orchestrator/orchestrator.hpp"

#include "goalflow/executor/task_executor.hpp"
#include "goalflow/plan/plan_graph.hpp"
#include "goalflow/reflection/episode_learner.hpp"
#include "goalflow/util/log.hpp"

#include <exception>
#include <format>
#include <string_view>
#include <utility>

namespace goalflow {
namespace {

template <typename Sink, typename... Args>
auto notify(Sink &sink, std::string_view name, Args &&...args) -> void {
  if (!sink) {
    return;
  }
  try {
    sink(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    log::warn("{} hook threw: {}", name, e.what());
  } catch (...) {
    log::warn("{} hook threw a non-standard exception", name);
  }
}

[[nodiscard]] auto join_ids(const std::vector<TaskId> &ids) -> std::string {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ", ";
    }
    out += id.str();
  }
  return out;
}

} // namespace

GoalOrchestrator::GoalOrchestrator(IPlanner &planner,
                                   ICapabilityInvoker &invoker,
                                   EngineConfig config, EngineHooks hooks,
                                   EpisodeLearner *learner)
    : planner_(planner), invoker_(invoker), config_(std::move(config)),
      hooks_(std::move(hooks)), learner_(learner),
      evaluator_(config_.reflection) {}

auto GoalOrchestrator::execute_goal(const Goal &goal, TrustLevel trust,
                                    std::string *diagnostic)
    -> Result<GoalReport> {
  cancel_requested_.store(false, std::memory_order_release);
  log::info("Goal {}: planning '{}' (trust={})", goal.id, goal.description,
            to_string_view(trust));

  const auto capabilities = invoker_.capabilities();
  Result<std::vector<Task>> generated = fail(Error::PlanUnavailable);
  try {
    generated = planner_.generate_plan(goal, capabilities);
  } catch (const std::exception &e) {
    log::error("Goal {}: planner threw: {}", goal.id, e.what());
    if (diagnostic) {
      *diagnostic = std::format("planner error: {}", e.what());
    }
    return fail(Error::PlanUnavailable);
  } catch (...) {
    log::error("Goal {}: planner threw a non-standard exception", goal.id);
    if (diagnostic) {
      *diagnostic = "planner error: non-standard exception";
    }
    return fail(Error::PlanUnavailable);
  }
  if (!generated) {
    log::error("Goal {}: planner failed: {}", goal.id,
               generated.error().message());
    if (diagnostic) {
      *diagnostic = generated.error().message();
    }
    return fail(generated.error());
  }
  if (generated->empty()) {
    log::error("Goal {}: planner produced no tasks", goal.id);
    if (diagnostic) {
      *diagnostic = "planner produced no tasks";
    }
    return fail(Error::PlanUnavailable);
  }

  auto graph = PlanGraph::from_tasks(generate_plan_id(), goal.id,
                                     std::move(*generated));
  if (!graph) {
    if (diagnostic) {
      *diagnostic = "plan contains duplicate task ids";
    }
    return fail(graph.error());
  }
  if (auto valid = graph->validate(diagnostic); !valid) {
    log::error("Goal {}: rejected plan {}: {}", goal.id, graph->plan().id,
               valid.error().message());
    return fail(valid.error());
  }
  log::info("Goal {}: plan {} with {} tasks", goal.id, graph->plan().id,
            graph->size());
  notify(hooks_.on_plan_created, "on_plan_created", graph->plan());

  GoalReport report;
  report.goal = goal;

  if (requires_approval(trust)) {
    log::info("Goal {}: plan {} awaits approval", goal.id, graph->plan().id);
    report.plan = graph->plan();
    report.awaiting_approval = true;
    return ok(std::move(report));
  }

  if (auto r = graph->transition(PlanStatus::Approved); !r) {
    return fail(r.error());
  }
  if (auto r = graph->transition(PlanStatus::Executing); !r) {
    return fail(r.error());
  }

  run_waves(*graph, goal, report);
  finalize(*graph, goal, report);
  return ok(std::move(report));
}

auto GoalOrchestrator::run_waves(PlanGraph &graph, const Goal &goal,
                                 GoalReport &report) -> void {
  TaskExecutor executor(invoker_, config_.executor);
  const auto &opts = config_.orchestrator;
  std::size_t wave = 0;

  for (;;) {
    if (cancel_requested()) {
      const auto n = graph.cancel_pending();
      log::info("Goal {}: cancelled, {} pending tasks dropped", goal.id, n);
      break;
    }

    auto ready = graph.ready_tasks();
    if (ready.empty()) {
      if (graph.all_finished()) {
        break;
      }
      report.blocked_tasks = graph.pending_tasks();
      report.fatal_error = make_error_code(Error::StuckPlan);
      report.fatal_detail =
          std::format("no task can run; blocked: {}",
                      join_ids(report.blocked_tasks));
      log::error("Goal {}: plan {} is stuck ({})", goal.id, graph.plan().id,
                 report.fatal_detail);
      graph.cancel_pending();
      break;
    }

    ++wave;
    log::debug("Goal {}: wave {} with {} tasks", goal.id, wave, ready.size());
    for (const auto &task : ready) {
      if (auto r = graph.mark_running(task.id); !r) {
        log::warn("Task {}: cannot mark running: {}", task.id,
                  r.error().message());
      }
      notify(hooks_.on_task_started, "on_task_started", task);
    }

    auto results =
        executor.run_many(ready, opts.max_concurrent_tasks, opts.retry);

    std::vector<std::size_t> failed;
    for (std::size_t i = 0; i < results.size(); ++i) {
      const auto &result = results[i];
      if (auto r = graph.apply_result(result); !r) {
        log::warn("Task {}: result not applied: {}", result.task_id,
                  r.error().message());
      }
      report.results.push_back(result);
      const auto *task = graph.find_task(result.task_id);
      const auto &current = task != nullptr ? *task : ready[i];
      if (result.success) {
        notify(hooks_.on_task_completed, "on_task_completed", current,
               result);
      } else {
        notify(hooks_.on_task_failed, "on_task_failed", current, result);
        if (!result.cancelled()) {
          failed.push_back(i);
        }
      }
    }

    bool revised = false;
    for (auto i : failed) {
      auto evaluation = evaluator_.evaluate_task(ready[i], results[i]);
      if (learner_ != nullptr) {
        learner_->observe(evaluation);
      }
      report.task_evaluations.push_back(evaluation);
      if (!revised && !report.fatal_error) {
        revised = try_replan(graph, ready[i], results[i], evaluation, report);
      }
    }
    if (report.fatal_error) {
      graph.cancel_pending();
      break;
    }
  }
}

auto GoalOrchestrator::try_replan(PlanGraph &graph, const Task &failed,
                                  const TaskResult &result,
                                  const Evaluation &evaluation,
                                  GoalReport &report) -> bool {
  const auto &opts = config_.orchestrator;
  if (!opts.enable_reflection || !evaluation.should_replan) {
    return false;
  }
  if (report.replanning_attempts >= opts.max_replanning_attempts) {
    log::info("Task {}: replanning budget of {} exhausted, failure stands",
              failed.id, opts.max_replanning_attempts);
    return false;
  }

  ++report.replanning_attempts;
  log::info("Task {} failed ({}), requesting revision {}/{}", failed.id,
            result.error, report.replanning_attempts,
            opts.max_replanning_attempts);

  FailureContext context{.failed_task = failed.id,
                         .error = result.error,
                         .evaluation = evaluation,
                         .results = report.results,
                         .attempt = report.replanning_attempts};
  Result<std::vector<Task>> revised = fail(Error::PlanUnavailable);
  try {
    revised = planner_.revise_plan(graph.plan(), context);
  } catch (const std::exception &e) {
    log::warn("Task {}: planner threw during revision: {}", failed.id,
              e.what());
    return false;
  } catch (...) {
    log::warn("Task {}: planner threw a non-standard exception during "
              "revision",
              failed.id);
    return false;
  }
  if (!revised) {
    log::warn("Task {}: revision unavailable: {}", failed.id,
              revised.error().message());
    return false;
  }
  if (revised->empty()) {
    log::info("Task {}: planner kept the current plan", failed.id);
    return false;
  }

  std::string diagnostic;
  auto summary = graph.apply_revision(std::move(*revised), failed.id,
                                      &diagnostic);
  if (!summary) {
    report.fatal_error = summary.error();
    report.fatal_detail = std::format("invalid revision: {}", diagnostic);
    log::error("Plan {}: {}", graph.plan().id, report.fatal_detail);
    return false;
  }
  log::info("Goal {}: revision {} replaced {} tasks with {}",
            graph.plan().goal_id, report.replanning_attempts,
            summary->dropped, summary->added);
  return true;
}

auto GoalOrchestrator::finalize(PlanGraph &graph, const Goal &goal,
                                GoalReport &report) -> void {
  auto final_status = PlanStatus::Completed;
  if (report.fatal_error) {
    final_status = PlanStatus::Failed;
  } else if (cancel_requested()) {
    final_status = PlanStatus::Cancelled;
  } else if (!graph.all_completed()) {
    final_status = PlanStatus::Failed;
  }
  if (auto r = graph.transition(final_status); !r) {
    log::warn("Plan {}: cannot move to {}: {}", graph.plan().id,
              to_string_view(final_status), r.error().message());
  }

  report.plan = graph.plan();
  report.success = !report.fatal_error &&
                   final_status == PlanStatus::Completed &&
                   graph.all_completed();

  Episode episode{.id = generate_episode_id(),
                  .goal = goal,
                  .plan = report.plan,
                  .results = report.results,
                  .success = report.success,
                  .replanning_attempts = report.replanning_attempts,
                  .created_at = util::Clock::now()};
  report.episode_id = episode.id;
  notify(hooks_.on_episode_recorded, "on_episode_recorded",
         std::as_const(episode));

  auto evaluation = evaluator_.evaluate_plan(report.plan, report.results);
  notify(hooks_.on_plan_evaluated, "on_plan_evaluated",
         std::as_const(evaluation));
  if (learner_ != nullptr) {
    learner_->observe(evaluation);
    learner_->learn_from_episode(episode);
  }
  report.plan_evaluation = std::move(evaluation);

  log::info("Goal {}: {} (status={} tasks={} results={} replans={})", goal.id,
            report.success ? "succeeded" : "failed",
            to_string_view(report.plan.status), report.plan.tasks.size(),
            report.results.size(), report.replanning_attempts);
}

} // namespace goalflow
