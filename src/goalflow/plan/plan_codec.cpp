#include "goalflow/plan/plan_codec.hpp"

#include "goalflow/util/file.hpp"
#include "goalflow/util/log.hpp"
#include "goalflow/util/time.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <utility>

namespace goalflow {
namespace detail {

struct TaskJson {
  std::string id;
  std::string description;
  std::string capability;
  JsonValue params{};
  std::vector<std::string> dependencies;
  JsonValue metadata{};
};

struct PlanJson {
  std::string goal;
  std::vector<TaskJson> tasks;
};

} // namespace detail
} // namespace goalflow

namespace glz {
template <> struct meta<goalflow::detail::TaskJson> {
  using T = goalflow::detail::TaskJson;
  static constexpr auto value =
      object("id", &T::id, "description", &T::description, "capability",
             &T::capability, "params", &T::params, "dependencies",
             &T::dependencies, "metadata", &T::metadata);
};

template <> struct meta<goalflow::detail::PlanJson> {
  using T = goalflow::detail::PlanJson;
  static constexpr auto value = object("goal", &T::goal, "tasks", &T::tasks);
};
} // namespace glz

namespace goalflow {
namespace {

[[nodiscard]] auto convert_task(detail::TaskJson &raw) -> Task {
  Task task;
  task.id = TaskId{std::move(raw.id)};
  task.description = std::move(raw.description);
  task.capability = std::move(raw.capability);
  task.params = from_json_object(raw.params);
  task.metadata = from_json_object(raw.metadata);
  task.dependencies.reserve(raw.dependencies.size());
  for (auto &dep : raw.dependencies) {
    task.dependencies.emplace_back(std::move(dep));
  }
  return task;
}

[[nodiscard]] auto time_json(util::TimePoint tp) -> JsonValue {
  if (tp == util::TimePoint{}) {
    return JsonValue{};
  }
  return util::format_iso8601(tp);
}

} // namespace

auto PlanCodec::parse(std::string_view json_text, std::string *diagnostic)
    -> Result<PlanDocument> {
  detail::PlanJson raw{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, json_text); ec) {
    auto detail = glz::format_error(ec, json_text);
    log::error("Plan JSON parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }

  PlanDocument doc;
  doc.goal = std::move(raw.goal);
  doc.tasks.reserve(raw.tasks.size());
  for (auto &t : raw.tasks) {
    if (t.capability.empty()) {
      if (diagnostic) {
        *diagnostic = std::format("task '{}' has no capability", t.id);
      }
      return fail(Error::InvalidArgument);
    }
    doc.tasks.emplace_back(convert_task(t));
  }
  return ok(std::move(doc));
}

auto PlanCodec::load_from_file(std::string_view path, std::string *diagnostic)
    -> Result<PlanDocument> {
  auto text = util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read {}", path);
    }
    return fail(text.error());
  }
  return parse(*text, diagnostic);
}

auto PlanCodec::to_json(const Task &task) -> JsonValue {
  JsonValue deps = std::vector<JsonValue>{};
  for (const auto &dep : task.dependencies) {
    deps.get_array().emplace_back(dep.str());
  }
  JsonValue obj{
      {"id", task.id.str()},
      {"plan_id", task.plan_id.str()},
      {"description", task.description},
      {"capability", task.capability},
      {"params", goalflow::to_json(task.params)},
      {"dependencies", std::move(deps)},
      {"status", std::string(to_string_view(task.status))},
      {"started_at", time_json(task.started_at)},
      {"finished_at", time_json(task.finished_at)},
      {"metadata", goalflow::to_json(task.metadata)},
  };
  if (task.output) {
    obj.get_object().emplace("output", *task.output);
  }
  if (task.error) {
    obj.get_object().emplace("error", *task.error);
  }
  return obj;
}

auto PlanCodec::to_json(const Plan &plan) -> JsonValue {
  JsonValue tasks = std::vector<JsonValue>{};
  for (const auto &task : plan.tasks) {
    tasks.get_array().emplace_back(to_json(task));
  }
  return JsonValue{
      {"id", plan.id.str()},
      {"goal_id", plan.goal_id.str()},
      {"status", std::string(to_string_view(plan.status))},
      {"created_at", time_json(plan.created_at)},
      {"approved_at", time_json(plan.approved_at)},
      {"started_at", time_json(plan.started_at)},
      {"completed_at", time_json(plan.completed_at)},
      {"tasks", std::move(tasks)},
      {"metadata", goalflow::to_json(plan.metadata)},
  };
}

auto PlanCodec::to_json(const TaskResult &result) -> JsonValue {
  JsonValue logs = std::vector<JsonValue>{};
  for (const auto &line : result.logs) {
    logs.get_array().emplace_back(line);
  }
  return JsonValue{
      {"task_id", result.task_id.str()},
      {"capability", result.capability},
      {"success", result.success},
      {"output", result.output},
      {"error", result.error},
      {"logs", std::move(logs)},
      {"execution_time_ms",
       static_cast<std::int64_t>(
           std::chrono::duration_cast<std::chrono::milliseconds>(
               result.duration)
               .count())},
      {"started_at", time_json(result.started_at)},
      {"finished_at", time_json(result.finished_at)},
      {"metadata", goalflow::to_json(result.metadata)},
  };
}

auto PlanCodec::to_json(const Goal &goal) -> JsonValue {
  return JsonValue{
      {"id", goal.id.str()},
      {"description", goal.description},
      {"constraints", goalflow::to_json(goal.constraints)},
      {"context", goalflow::to_json(goal.context)},
      {"priority", static_cast<std::int64_t>(goal.priority)},
  };
}

} // namespace goalflow
