#include "goalflow/monitor/progress_tracker.hpp"

#include "goalflow/util/log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace goalflow {

auto ProgressTracker::update(ProgressUpdate update) -> void {
  update.progress = std::clamp(update.progress, 0.0, 1.0);
  if (update.timestamp == util::TimePoint{}) {
    update.timestamp = util::Clock::now();
  }

  std::vector<ProgressListener> listeners;
  {
    std::lock_guard lock(mu_);
    history_[update.task_id].emplace_back(update);
    listeners.reserve(listeners_.size());
    for (const auto &[_, fn] : listeners_) {
      listeners.emplace_back(fn);
    }
  }

  for (auto &fn : listeners) {
    try {
      fn(update);
    } catch (const std::exception &e) {
      log::warn("Progress listener threw for task {}: {}", update.task_id,
                e.what());
    } catch (...) {
      log::warn("Progress listener threw a non-standard exception for task {}",
                update.task_id);
    }
  }
}

auto ProgressTracker::latest(const TaskId &task_id) const
    -> std::optional<ProgressUpdate> {
  std::lock_guard lock(mu_);
  auto it = history_.find(task_id);
  if (it == history_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

auto ProgressTracker::history(const TaskId &task_id) const
    -> std::vector<ProgressUpdate> {
  std::lock_guard lock(mu_);
  auto it = history_.find(task_id);
  if (it == history_.end()) {
    return {};
  }
  return it->second;
}

auto ProgressTracker::active_tasks() const -> std::vector<TaskId> {
  std::lock_guard lock(mu_);
  std::vector<TaskId> out;
  for (const auto &[id, updates] : history_) {
    if (updates.empty()) {
      continue;
    }
    const auto s = updates.back().status;
    if (s == ProgressStatus::Starting || s == ProgressStatus::InProgress ||
        s == ProgressStatus::Completing) {
      out.emplace_back(id);
    }
  }
  return out;
}

auto ProgressTracker::add_listener(ProgressListener listener) -> ListenerId {
  std::lock_guard lock(mu_);
  const auto id = next_listener_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

auto ProgressTracker::remove_listener(ListenerId id) -> bool {
  std::lock_guard lock(mu_);
  return std::erase_if(listeners_, [id](const auto &entry) {
           return entry.first == id;
         }) > 0;
}

auto ProgressTracker::clear(const TaskId &task_id) -> void {
  std::lock_guard lock(mu_);
  history_.erase(task_id);
}

auto ProgressTracker::clear_all() -> void {
  std::lock_guard lock(mu_);
  history_.clear();
}

auto compute_execution_stats(std::span<const Task> tasks) -> ExecutionStats {
  ExecutionStats stats;
  stats.total = tasks.size();
  double total_seconds = 0.0;
  std::size_t timed = 0;

  for (const auto &task : tasks) {
    switch (task.status) {
    case TaskStatus::Completed:
      ++stats.completed;
      break;
    case TaskStatus::Failed:
      ++stats.failed;
      break;
    case TaskStatus::Running:
      ++stats.running;
      break;
    case TaskStatus::Pending:
      ++stats.pending;
      break;
    case TaskStatus::Cancelled:
      ++stats.cancelled;
      break;
    }
    if (is_terminal(task.status) && task.started_at != util::TimePoint{} &&
        task.finished_at >= task.started_at) {
      total_seconds += util::to_seconds(task.finished_at - task.started_at);
      ++timed;
    }
  }

  const auto finished = stats.completed + stats.failed + stats.cancelled;
  if (finished > 0) {
    stats.success_rate =
        static_cast<double>(stats.completed) / static_cast<double>(finished);
  }
  if (timed > 0) {
    stats.average_duration_seconds = total_seconds / static_cast<double>(timed);
  }
  return stats;
}

} // namespace goalflow
