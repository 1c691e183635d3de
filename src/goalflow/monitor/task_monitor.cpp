#include "goalflow/monitor/task_monitor.hpp"

#include "goalflow/util/log.hpp"

#include <utility>

namespace goalflow {

auto TaskMonitor::start(const TaskId &task_id) -> void {
  std::lock_guard lock(mu_);
  ExecutionMetrics m;
  m.task_id = task_id;
  m.start_time = util::Clock::now();
  // A retried task starts a fresh record.
  metrics_.insert_or_assign(task_id, std::move(m));
}

auto TaskMonitor::checkpoint(const TaskId &task_id, std::string name,
                             JsonValue data) -> bool {
  std::lock_guard lock(mu_);
  auto it = metrics_.find(task_id);
  if (it == metrics_.end()) {
    log::debug("checkpoint '{}' for unknown task {}", name, task_id);
    return false;
  }
  it->second.checkpoints.emplace_back(Checkpoint{
      .name = std::move(name), .at = util::Clock::now(), .data = std::move(data)});
  return true;
}

auto TaskMonitor::end(const TaskId &task_id) -> void {
  std::lock_guard lock(mu_);
  auto it = metrics_.find(task_id);
  if (it == metrics_.end()) {
    return;
  }
  auto &m = it->second;
  m.end_time = util::Clock::now();
  m.duration = *m.end_time - m.start_time;
}

auto TaskMonitor::metrics(const TaskId &task_id) const
    -> std::optional<ExecutionMetrics> {
  std::lock_guard lock(mu_);
  auto it = metrics_.find(task_id);
  if (it == metrics_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TaskMonitor::all_metrics() const -> std::vector<ExecutionMetrics> {
  std::lock_guard lock(mu_);
  std::vector<ExecutionMetrics> out;
  out.reserve(metrics_.size());
  for (const auto &[_, m] : metrics_) {
    out.emplace_back(m);
  }
  return out;
}

auto TaskMonitor::running_tasks() const -> std::vector<TaskId> {
  std::lock_guard lock(mu_);
  std::vector<TaskId> out;
  for (const auto &[id, m] : metrics_) {
    if (!m.finished()) {
      out.emplace_back(id);
    }
  }
  return out;
}

auto TaskMonitor::clear(const TaskId &task_id) -> void {
  std::lock_guard lock(mu_);
  metrics_.erase(task_id);
}

auto TaskMonitor::clear_all() -> void {
  std::lock_guard lock(mu_);
  metrics_.clear();
}

} // namespace goalflow
