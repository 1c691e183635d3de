#include "goalflow/orchestrator/report.hpp"

#include "goalflow/plan/plan_codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace goalflow {
namespace {

[[nodiscard]] auto strings_json(const std::vector<std::string> &items)
    -> JsonValue {
  JsonValue out = std::vector<JsonValue>{};
  for (const auto &item : items) {
    out.get_array().emplace_back(item);
  }
  return out;
}

[[nodiscard]] auto ids_json(const std::vector<TaskId> &ids) -> JsonValue {
  JsonValue out = std::vector<JsonValue>{};
  for (const auto &id : ids) {
    out.get_array().emplace_back(id.str());
  }
  return out;
}

[[nodiscard]] auto pattern_json(const FailurePattern &pattern) -> JsonValue {
  JsonValue obj{
      {"kind", std::string(to_string_view(pattern.kind))},
      {"description", pattern.description},
      {"occurrences", static_cast<std::int64_t>(pattern.occurrences)},
      {"tasks", ids_json(pattern.tasks)},
  };
  if (pattern.category) {
    obj.get_object().emplace("category",
                             std::string(to_string_view(*pattern.category)));
  }
  if (!pattern.capability.empty()) {
    obj.get_object().emplace("capability", pattern.capability);
  }
  return obj;
}

} // namespace

auto to_json(const Evaluation &evaluation) -> JsonValue {
  JsonValue patterns = std::vector<JsonValue>{};
  for (const auto &pattern : evaluation.patterns) {
    patterns.get_array().emplace_back(pattern_json(pattern));
  }
  JsonValue obj{
      {"success", evaluation.success},
      {"confidence", evaluation.confidence},
      {"issues", strings_json(evaluation.issues)},
      {"suggestions", strings_json(evaluation.suggestions)},
      {"should_replan", evaluation.should_replan},
      {"patterns", std::move(patterns)},
  };
  auto &fields = obj.get_object();
  if (evaluation.task_id) {
    fields.emplace("task_id", evaluation.task_id->str());
  }
  if (evaluation.plan_id) {
    fields.emplace("plan_id", evaluation.plan_id->str());
    if (!evaluation.task_id) {
      fields.emplace("success_rate", evaluation.success_rate);
    }
  }
  if (evaluation.category) {
    fields.emplace("category",
                   std::string(to_string_view(*evaluation.category)));
  }
  return obj;
}

auto to_json(const GoalReport &report) -> JsonValue {
  JsonValue results = std::vector<JsonValue>{};
  for (const auto &result : report.results) {
    results.get_array().emplace_back(PlanCodec::to_json(result));
  }
  JsonValue evaluations = std::vector<JsonValue>{};
  for (const auto &evaluation : report.task_evaluations) {
    evaluations.get_array().emplace_back(to_json(evaluation));
  }

  JsonValue obj{
      {"goal", PlanCodec::to_json(report.goal)},
      {"plan", PlanCodec::to_json(report.plan)},
      {"results", std::move(results)},
      {"success", report.success},
      {"replanning_attempts",
       static_cast<std::int64_t>(report.replanning_attempts)},
      {"awaiting_approval", report.awaiting_approval},
      {"task_evaluations", std::move(evaluations)},
  };
  auto &fields = obj.get_object();
  fields.emplace("plan_evaluation", report.plan_evaluation
                                        ? to_json(*report.plan_evaluation)
                                        : JsonValue{});
  fields.emplace("episode_id", report.episode_id
                                   ? JsonValue(report.episode_id->str())
                                   : JsonValue{});
  if (report.fatal_error) {
    fields.emplace("fatal_error", report.fatal_error.message());
    fields.emplace("fatal_detail", report.fatal_detail);
    fields.emplace("blocked_tasks", ids_json(report.blocked_tasks));
  }
  return obj;
}

} // namespace goalflow
