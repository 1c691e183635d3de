#include "goalflow/plan/plan_graph.hpp"

#include "goalflow/util/log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace goalflow {

PlanGraph::PlanGraph(PlanId plan_id, GoalId goal_id) {
  plan_.id = std::move(plan_id);
  plan_.goal_id = std::move(goal_id);
  plan_.created_at = util::Clock::now();
}

auto PlanGraph::from_tasks(PlanId plan_id, GoalId goal_id,
                           std::vector<Task> tasks) -> Result<PlanGraph> {
  PlanGraph graph(std::move(plan_id), std::move(goal_id));
  for (auto &task : tasks) {
    if (auto r = graph.add_task(std::move(task)); !r) {
      return fail(r.error());
    }
  }
  return ok(std::move(graph));
}

auto PlanGraph::add_task(Task task) -> Result<void> {
  if (key_to_idx_.contains(task.id)) [[unlikely]] {
    log::warn("Plan {}: duplicate task id '{}'", plan_.id, task.id);
    return fail(Error::DuplicateTask);
  }
  task.plan_id = plan_.id;
  auto idx = static_cast<NodeIndex>(plan_.tasks.size());
  key_to_idx_.emplace(task.id, idx);
  plan_.tasks.emplace_back(std::move(task));
  return ok();
}

auto PlanGraph::get_index(const TaskId &task_id) const noexcept -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto PlanGraph::rebuild_index() -> void {
  key_to_idx_.clear();
  for (NodeIndex i = 0; i < plan_.tasks.size(); ++i) {
    key_to_idx_.emplace(plan_.tasks[i].id, i);
  }
}

auto PlanGraph::resolve_deps() const -> std::vector<std::vector<NodeIndex>> {
  std::vector<std::vector<NodeIndex>> deps(plan_.tasks.size());
  for (NodeIndex i = 0; i < plan_.tasks.size(); ++i) {
    for (const auto &dep : plan_.tasks[i].dependencies) {
      if (auto idx = get_index(dep); idx != kInvalidNode) {
        deps[i].emplace_back(idx);
      }
    }
  }
  return deps;
}

auto PlanGraph::validate(std::string *diagnostic) const -> Result<void> {
  auto report = [diagnostic](Error e, std::string message) {
    log::debug("Plan validation failed: {}", message);
    if (diagnostic) {
      *diagnostic = std::move(message);
    }
    return fail(e);
  };

  for (const auto &task : plan_.tasks) {
    if (!is_valid_id_text(task.id.value())) {
      return report(Error::InvalidArgument, "task with empty or invalid id");
    }
    for (const auto &dep : task.dependencies) {
      if (dep == task.id) {
        return report(Error::SelfDependency,
                      std::format("task '{}' depends on itself", task.id));
      }
      if (!key_to_idx_.contains(dep)) {
        return report(
            Error::DanglingDependency,
            std::format("task '{}' depends on unknown task '{}'", task.id,
                        dep));
      }
    }
  }

  // Edges run dependency -> dependent; a gray node reached again closes a
  // cycle.
  const auto n = plan_.tasks.size();
  std::vector<std::vector<NodeIndex>> dependents(n);
  const auto deps = resolve_deps();
  for (NodeIndex i = 0; i < n; ++i) {
    for (NodeIndex d : deps[i]) {
      dependents[d].emplace_back(i);
    }
  }

  std::vector<std::uint8_t> state(n, 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(n);

  for (NodeIndex start = 0; start < n; ++start) {
    if (state[start] != 0)
      continue;

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &children = dependents[node];

      if (child_idx < children.size()) {
        NodeIndex child = children[child_idx++];
        if (state[child] == 1) {
          std::string path;
          auto it = std::ranges::find_if(
              stack, [child](const auto &e) { return e.first == child; });
          for (; it != stack.end(); ++it) {
            path += std::format("{} -> ", plan_.tasks[it->first].id);
          }
          path += plan_.tasks[child].id.str();
          return report(Error::CycleDetected,
                        std::format("dependency cycle: {}", path));
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto PlanGraph::ready_tasks() const -> std::vector<Task> {
  std::vector<Task> ready;
  for (const auto &task : plan_.tasks) {
    if (task.status != TaskStatus::Pending) {
      continue;
    }
    const bool deps_done =
        std::ranges::all_of(task.dependencies, [this](const TaskId &dep) {
          const auto *t = find_task(dep);
          return t != nullptr && t->status == TaskStatus::Completed;
        });
    if (deps_done) {
      ready.emplace_back(task);
    }
  }
  return ready;
}

auto PlanGraph::find_task(const TaskId &task_id) const noexcept
    -> const Task * {
  auto idx = get_index(task_id);
  return idx != kInvalidNode ? &plan_.tasks[idx] : nullptr;
}

auto PlanGraph::get_task(const TaskId &task_id) const -> Result<Task> {
  const auto *task = find_task(task_id);
  if (!task) {
    return fail(Error::NotFound);
  }
  return ok(*task);
}

auto PlanGraph::contains(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto PlanGraph::mark_running(const TaskId &task_id) -> Result<void> {
  auto idx = get_index(task_id);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }
  auto &task = plan_.tasks[idx];
  if (task.status != TaskStatus::Pending) {
    return fail(Error::InvalidState);
  }
  task.status = TaskStatus::Running;
  task.started_at = util::Clock::now();
  return ok();
}

auto PlanGraph::apply_result(const TaskResult &result) -> Result<void> {
  auto idx = get_index(result.task_id);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }
  auto &task = plan_.tasks[idx];
  if (is_terminal(task.status)) {
    return fail(Error::InvalidState);
  }

  if (result.cancelled()) {
    task.status = TaskStatus::Cancelled;
  } else {
    task.status = result.success ? TaskStatus::Completed : TaskStatus::Failed;
  }
  if (result.success) {
    task.output = result.output;
    task.error.reset();
  } else {
    task.error = result.error;
  }
  if (result.started_at != util::TimePoint{}) {
    task.started_at = result.started_at;
  }
  task.finished_at = result.finished_at != util::TimePoint{}
                         ? result.finished_at
                         : util::Clock::now();
  return ok();
}

auto PlanGraph::mark_cancelled(const TaskId &task_id) -> Result<void> {
  auto idx = get_index(task_id);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }
  auto &task = plan_.tasks[idx];
  if (is_terminal(task.status)) {
    return fail(Error::InvalidState);
  }
  task.status = TaskStatus::Cancelled;
  task.finished_at = util::Clock::now();
  return ok();
}

auto PlanGraph::cancel_pending() -> std::size_t {
  std::size_t n = 0;
  const auto now = util::Clock::now();
  for (auto &task : plan_.tasks) {
    if (task.status == TaskStatus::Pending) {
      task.status = TaskStatus::Cancelled;
      task.finished_at = now;
      ++n;
    }
  }
  return n;
}

auto PlanGraph::all_finished() const noexcept -> bool {
  return std::ranges::all_of(plan_.tasks, [](const Task &t) {
    return is_terminal(t.status);
  });
}

auto PlanGraph::all_completed() const noexcept -> bool {
  return std::ranges::all_of(plan_.tasks, [](const Task &t) {
    return t.status == TaskStatus::Completed;
  });
}

auto PlanGraph::pending_tasks() const -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (const auto &task : plan_.tasks) {
    if (task.status == TaskStatus::Pending) {
      out.emplace_back(task.id);
    }
  }
  return out;
}

auto PlanGraph::count(TaskStatus status) const noexcept -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      plan_.tasks, [status](const Task &t) { return t.status == status; }));
}

auto PlanGraph::topological_waves() const
    -> Result<std::vector<std::vector<TaskId>>> {
  if (auto r = validate(); !r) {
    return fail(r.error());
  }

  const auto n = plan_.tasks.size();
  const auto deps = resolve_deps();
  std::vector<std::size_t> level(n, 0);
  std::vector<bool> placed(n, false);
  std::vector<std::vector<TaskId>> waves;

  std::size_t remaining = n;
  while (remaining > 0) {
    std::vector<NodeIndex> wave;
    for (NodeIndex i = 0; i < n; ++i) {
      if (placed[i])
        continue;
      const bool ready = std::ranges::all_of(
          deps[i], [&](NodeIndex d) { return placed[d]; });
      if (ready) {
        wave.emplace_back(i);
      }
    }
    // Validated above, so every round places at least one task.
    auto &ids = waves.emplace_back();
    for (NodeIndex i : wave) {
      placed[i] = true;
      ids.emplace_back(plan_.tasks[i].id);
    }
    remaining -= wave.size();
  }
  return ok(std::move(waves));
}

auto PlanGraph::longest_chain() const -> std::size_t {
  auto waves = topological_waves();
  return waves ? waves->size() : 0;
}

auto PlanGraph::apply_revision(std::vector<Task> revised,
                               const TaskId &superseded,
                               std::string *diagnostic)
    -> Result<RevisionSummary> {
  RevisionSummary summary;
  std::vector<Task> merged;
  merged.reserve(plan_.tasks.size() + revised.size());
  ankerl::unordered_dense::set<TaskId> kept_ids;

  for (const auto &task : plan_.tasks) {
    const bool keep =
        task.status == TaskStatus::Completed ||
        task.status == TaskStatus::Cancelled ||
        (task.status == TaskStatus::Failed && task.id != superseded);
    if (keep) {
      kept_ids.insert(task.id);
      merged.emplace_back(task);
      ++summary.kept;
    } else {
      ++summary.dropped;
    }
  }

  ankerl::unordered_dense::set<TaskId> added_ids;
  for (auto &task : revised) {
    if (kept_ids.contains(task.id)) {
      ++summary.ignored;
      continue;
    }
    if (!added_ids.insert(task.id).second) {
      if (diagnostic) {
        *diagnostic =
            std::format("revision declares task '{}' more than once", task.id);
      }
      return fail(Error::DuplicateTask);
    }
    task.plan_id = plan_.id;
    task.status = TaskStatus::Pending;
    task.output.reset();
    task.error.reset();
    task.started_at = {};
    task.finished_at = {};
    merged.emplace_back(std::move(task));
    ++summary.added;
  }

  auto previous = std::exchange(plan_.tasks, std::move(merged));
  rebuild_index();
  if (auto r = validate(diagnostic); !r) {
    plan_.tasks = std::move(previous);
    rebuild_index();
    return fail(r.error());
  }

  log::info("Plan {} revised: kept={} added={} dropped={} ignored={}",
            plan_.id, summary.kept, summary.added, summary.dropped,
            summary.ignored);
  return ok(summary);
}

auto PlanGraph::transition(PlanStatus next) -> Result<void> {
  const auto current = plan_.status;
  bool allowed = false;
  switch (current) {
  case PlanStatus::Draft:
    allowed = next == PlanStatus::Approved || next == PlanStatus::Failed ||
              next == PlanStatus::Cancelled;
    break;
  case PlanStatus::Approved:
    allowed = next == PlanStatus::Executing || next == PlanStatus::Failed ||
              next == PlanStatus::Cancelled;
    break;
  case PlanStatus::Executing:
    allowed = is_terminal(next);
    break;
  case PlanStatus::Completed:
  case PlanStatus::Failed:
  case PlanStatus::Cancelled:
    allowed = false;
    break;
  }
  if (!allowed) {
    log::warn("Plan {}: rejected transition {} -> {}", plan_.id,
              to_string_view(current), to_string_view(next));
    return fail(Error::InvalidState);
  }

  const auto now = util::Clock::now();
  plan_.status = next;
  if (next == PlanStatus::Approved) {
    plan_.approved_at = now;
  } else if (next == PlanStatus::Executing) {
    plan_.started_at = now;
  } else if (is_terminal(next)) {
    plan_.completed_at = now;
  }
  return ok();
}

} // namespace goalflow
