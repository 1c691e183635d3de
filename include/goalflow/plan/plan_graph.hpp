#pragma once

#include "goalflow/core/error.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace goalflow {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

struct RevisionSummary {
  std::size_t kept{0};
  std::size_t added{0};
  std::size_t dropped{0};
  std::size_t ignored{0};
};

// Task DAG of a single plan. Owned and mutated by one thread (the
// orchestrator); tasks keep the order in which they were declared.
class PlanGraph {
public:
  PlanGraph() = default;
  PlanGraph(PlanId plan_id, GoalId goal_id);

  [[nodiscard]] static auto from_tasks(PlanId plan_id, GoalId goal_id,
                                       std::vector<Task> tasks)
      -> Result<PlanGraph>;

  [[nodiscard]] auto add_task(Task task) -> Result<void>;

  // Rejects empty ids, self dependencies, references to unknown tasks and
  // cycles. `diagnostic` receives a message naming the offending tasks.
  [[nodiscard]] auto validate(std::string *diagnostic = nullptr) const
      -> Result<void>;

  // Pending tasks whose dependencies have all completed, in declaration order.
  [[nodiscard]] auto ready_tasks() const -> std::vector<Task>;

  [[nodiscard]] auto get_task(const TaskId &task_id) const -> Result<Task>;
  [[nodiscard]] auto find_task(const TaskId &task_id) const noexcept
      -> const Task *;
  [[nodiscard]] auto contains(const TaskId &task_id) const -> bool;

  [[nodiscard]] auto mark_running(const TaskId &task_id) -> Result<void>;
  [[nodiscard]] auto apply_result(const TaskResult &result) -> Result<void>;
  [[nodiscard]] auto mark_cancelled(const TaskId &task_id) -> Result<void>;
  auto cancel_pending() -> std::size_t;

  [[nodiscard]] auto all_finished() const noexcept -> bool;
  [[nodiscard]] auto all_completed() const noexcept -> bool;
  [[nodiscard]] auto pending_tasks() const -> std::vector<TaskId>;
  [[nodiscard]] auto count(TaskStatus status) const noexcept -> std::size_t;

  // Groups of tasks that can run together, each group depending only on
  // earlier ones. Fails on an invalid graph.
  [[nodiscard]] auto topological_waves() const
      -> Result<std::vector<std::vector<TaskId>>>;
  [[nodiscard]] auto longest_chain() const -> std::size_t;

  // Completed tasks are kept; pending tasks and `superseded` are replaced by
  // `revised`. Revision entries naming a kept task are ignored. The graph is
  // left untouched if the merged result does not validate.
  [[nodiscard]] auto apply_revision(std::vector<Task> revised,
                                    const TaskId &superseded,
                                    std::string *diagnostic = nullptr)
      -> Result<RevisionSummary>;

  [[nodiscard]] auto transition(PlanStatus next) -> Result<void>;

  [[nodiscard]] auto plan() const noexcept -> const Plan & { return plan_; }
  [[nodiscard]] auto tasks() const noexcept -> const std::vector<Task> & {
    return plan_.tasks;
  }
  [[nodiscard]] auto status() const noexcept -> PlanStatus {
    return plan_.status;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return plan_.tasks.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return plan_.tasks.empty();
  }

private:
  [[nodiscard]] auto get_index(const TaskId &task_id) const noexcept
      -> NodeIndex;
  [[nodiscard]] auto resolve_deps() const -> std::vector<std::vector<NodeIndex>>;
  auto rebuild_index() -> void;

  Plan plan_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
};

} // namespace goalflow
