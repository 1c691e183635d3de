#include "goalflow/reflection/evaluator.hpp"

#include "goalflow/plan/plan_graph.hpp"
#include "goalflow/reflection/failure_classifier.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <format>
#include <map>
#include <string>
#include <vector>

namespace goalflow {
namespace {

[[nodiscard]] auto category_of(const TaskResult &result) -> FailureCategory {
  if (result.timed_out()) {
    return FailureCategory::Timeout;
  }
  return classify_error(result.error);
}

[[nodiscard]] auto expected_seconds(const Task &task)
    -> std::optional<double> {
  auto it = task.metadata.find(task_meta::kExpectedTimeSeconds);
  if (it == task.metadata.end()) {
    return std::nullopt;
  }
  auto value = json_number(it->second);
  if (!value || *value <= 0.0) {
    return std::nullopt;
  }
  return value;
}

auto add_category_patterns(const Plan &plan,
                           const ankerl::unordered_dense::map<
                               TaskId, const TaskResult *> &latest,
                           Evaluation &eval) -> void {
  std::map<FailureCategory, std::vector<TaskId>> by_category;
  std::map<std::string, std::vector<TaskId>, std::less<>> by_capability;
  for (const auto &task : plan.tasks) {
    auto it = latest.find(task.id);
    if (it == latest.end() || it->second->success) {
      continue;
    }
    by_category[category_of(*it->second)].push_back(task.id);
    by_capability[task.capability].push_back(task.id);
  }

  for (auto &[category, tasks] : by_category) {
    if (tasks.size() < 2) {
      continue;
    }
    auto description = std::format("Repeated {} errors across {} tasks",
                                   to_string_view(category), tasks.size());
    eval.issues.push_back(description);
    eval.suggestions.emplace_back(suggestion_for(category));
    eval.patterns.push_back(FailurePattern{.kind = PatternKind::RepeatedErrors,
                                           .description =
                                               std::move(description),
                                           .occurrences = tasks.size(),
                                           .tasks = std::move(tasks),
                                           .category = category,
                                           .capability = {}});
  }

  for (auto &[capability, tasks] : by_capability) {
    if (tasks.size() < 2) {
      continue;
    }
    auto description = std::format("Capability '{}' failed {} times",
                                    capability, tasks.size());
    eval.issues.push_back(description);
    eval.suggestions.push_back(std::format(
        "Consider an alternative to capability '{}'", capability));
    eval.patterns.push_back(FailurePattern{.kind = PatternKind::ToolFailure,
                                           .description =
                                               std::move(description),
                                           .occurrences = tasks.size(),
                                           .tasks = std::move(tasks),
                                           .category = std::nullopt,
                                           .capability = capability});
  }
}

// Longest run of failing tasks in declaration order. A task without a result
// breaks the run.
auto add_sequence_pattern(const Plan &plan,
                          const ankerl::unordered_dense::map<
                              TaskId, const TaskResult *> &latest,
                          Evaluation &eval) -> void {
  std::vector<TaskId> best;
  std::vector<TaskId> run;
  for (const auto &task : plan.tasks) {
    auto it = latest.find(task.id);
    if (it != latest.end() && !it->second->success) {
      run.push_back(task.id);
      if (run.size() > best.size()) {
        best = run;
      }
    } else {
      run.clear();
    }
  }
  if (best.size() < 2) {
    return;
  }

  auto description = std::format("{} consecutive tasks failed", best.size());
  eval.issues.push_back(description);
  eval.suggestions.emplace_back(
      "Check a shared precondition of the failing tasks before retrying");
  eval.patterns.push_back(FailurePattern{.kind =
                                             PatternKind::SequentialFailures,
                                         .description = std::move(description),
                                         .occurrences = best.size(),
                                         .tasks = std::move(best),
                                         .category = std::nullopt,
                                         .capability = {}});
}

auto add_structure_issues(const Plan &plan, Evaluation &eval) -> void {
  auto graph = PlanGraph::from_tasks(plan.id, plan.goal_id, plan.tasks);
  if (!graph) {
    return;
  }
  const auto depth = graph->longest_chain();
  const auto total = plan.tasks.size();
  if (depth < reflection_defaults::kLongChainDepth || total == 0) {
    return;
  }
  const auto ratio = static_cast<double>(depth) / static_cast<double>(total);
  if (ratio < reflection_defaults::kLongChainRatio) {
    return;
  }
  eval.issues.push_back(std::format(
      "Plan is a sequential chain of {} of its {} tasks", depth, total));
  eval.suggestions.emplace_back(
      "Look for steps that do not depend on each other and run them in "
      "parallel");
}

} // namespace

auto OutcomeEvaluator::evaluate_task(const Task &task,
                                     const TaskResult &result) const
    -> Evaluation {
  Evaluation eval;
  eval.task_id = task.id;
  eval.plan_id = task.plan_id.empty() ? std::nullopt
                                      : std::optional<PlanId>(task.plan_id);
  eval.created_at = util::Clock::now();
  eval.success = result.success;

  if (!result.success) {
    const auto category = category_of(result);
    eval.confidence = reflection_defaults::kTaskFailureConfidence;
    eval.category = category;
    eval.issues.push_back(std::format("Task failed: {}", result.error));
    eval.issues.push_back(
        std::format("Failure category: {}", to_string_view(category)));
    eval.suggestions.emplace_back(suggestion_for(category));
    eval.should_replan = should_replan_for(category);
    return eval;
  }

  eval.confidence = reflection_defaults::kTaskSuccessConfidence;

  if (auto expected = expected_seconds(task)) {
    const auto limit = *expected * criteria_.max_execution_time_multiplier;
    const auto took = result.duration_seconds();
    if (took > limit) {
      eval.issues.push_back(std::format(
          "Task took {:.2f}s, expected at most {:.2f}s", took, limit));
      eval.suggestions.emplace_back(
          "Review the task for performance problems or raise its estimate");
      eval.confidence = reflection_defaults::kSlowTaskConfidence;
    }
  }

  if (criteria_.check_output_quality && is_empty_json(result.output)) {
    eval.issues.emplace_back("Task produced no output");
    eval.suggestions.emplace_back(
        "Verify that the capability returns the expected data");
    eval.confidence = std::min(eval.confidence,
                               reflection_defaults::kSlowTaskConfidence);
  }
  return eval;
}

auto OutcomeEvaluator::evaluate_plan(const Plan &plan,
                                     std::span<const TaskResult> results) const
    -> Evaluation {
  Evaluation eval;
  eval.plan_id = plan.id;
  eval.created_at = util::Clock::now();

  ankerl::unordered_dense::map<TaskId, const TaskResult *> latest;
  for (const auto &result : results) {
    latest.insert_or_assign(result.task_id, &result);
  }

  std::size_t succeeded = 0;
  for (const auto &task : plan.tasks) {
    auto it = latest.find(task.id);
    if (it != latest.end() && it->second->success) {
      ++succeeded;
    }
  }
  const auto total = plan.tasks.size();
  eval.success_rate = total == 0 ? 1.0
                                 : static_cast<double>(succeeded) /
                                       static_cast<double>(total);
  const bool all_complete = succeeded == total;

  eval.success = eval.success_rate >= criteria_.min_success_rate &&
                 (!criteria_.require_all_tasks_complete || all_complete);

  if (eval.success_rate < criteria_.min_success_rate) {
    eval.issues.push_back(std::format(
        "Success rate {:.0f}% is below the required {:.0f}%",
        eval.success_rate * 100.0, criteria_.min_success_rate * 100.0));
  }
  if (criteria_.require_all_tasks_complete && !all_complete) {
    eval.issues.push_back(
        std::format("{} of {} tasks did not complete", total - succeeded,
                    total));
  }

  add_category_patterns(plan, latest, eval);
  add_sequence_pattern(plan, latest, eval);
  add_structure_issues(plan, eval);

  eval.should_replan = !eval.success;
  if (eval.should_replan) {
    eval.suggestions.emplace_back(
        "Revise the plan around the failed tasks");
  }
  eval.confidence = eval.success_rate;
  return eval;
}

} // namespace goalflow
