#pragma once

#include "goalflow/util/id.hpp"
#include "goalflow/util/json.hpp"
#include "goalflow/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace goalflow {

struct Checkpoint {
  std::string name;
  util::TimePoint at{};
  JsonValue data{};
};

struct ExecutionMetrics {
  TaskId task_id;
  util::TimePoint start_time{};
  std::optional<util::TimePoint> end_time;
  std::chrono::nanoseconds duration{0};
  std::vector<Checkpoint> checkpoints;

  [[nodiscard]] auto finished() const noexcept -> bool {
    return end_time.has_value();
  }
};

// Per-task timing and checkpoint store. All members are safe to call from
// worker threads.
class TaskMonitor {
public:
  auto start(const TaskId &task_id) -> void;
  auto checkpoint(const TaskId &task_id, std::string name,
                  JsonValue data = {}) -> bool;
  auto end(const TaskId &task_id) -> void;

  [[nodiscard]] auto metrics(const TaskId &task_id) const
      -> std::optional<ExecutionMetrics>;
  [[nodiscard]] auto all_metrics() const -> std::vector<ExecutionMetrics>;
  [[nodiscard]] auto running_tasks() const -> std::vector<TaskId>;

  auto clear(const TaskId &task_id) -> void;
  auto clear_all() -> void;

private:
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<TaskId, ExecutionMetrics> metrics_;
};

} // namespace goalflow
