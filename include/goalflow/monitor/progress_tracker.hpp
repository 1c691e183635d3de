#pragma once

#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/enum.hpp"
#include "goalflow/util/id.hpp"
#include "goalflow/util/json.hpp"
#include "goalflow/util/time.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace goalflow {

enum class ProgressStatus : std::uint8_t {
  Starting,
  InProgress,
  Completing,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(ProgressStatus, Starting, InProgress, Completing,
                    Completed, Failed, Cancelled)
GOALFLOW_DEFINE_ENUM_SERDE(ProgressStatus, ProgressStatus::Starting)

struct ProgressUpdate {
  TaskId task_id;
  ProgressStatus status{ProgressStatus::Starting};
  double progress{0.0}; // clamped to [0, 1]
  std::string message;
  util::TimePoint timestamp{};
  JsonMap metadata;
};

using ListenerId = std::uint64_t;
using ProgressListener = std::function<void(const ProgressUpdate &update)>;

// Latest progress and full history per task, with change listeners.
// Listeners run on the thread that reported the update, outside the lock.
class ProgressTracker {
public:
  auto update(ProgressUpdate update) -> void;

  [[nodiscard]] auto latest(const TaskId &task_id) const
      -> std::optional<ProgressUpdate>;
  [[nodiscard]] auto history(const TaskId &task_id) const
      -> std::vector<ProgressUpdate>;
  [[nodiscard]] auto active_tasks() const -> std::vector<TaskId>;

  auto add_listener(ProgressListener listener) -> ListenerId;
  auto remove_listener(ListenerId id) -> bool;

  auto clear(const TaskId &task_id) -> void;
  auto clear_all() -> void;

private:
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<TaskId, std::vector<ProgressUpdate>> history_;
  std::vector<std::pair<ListenerId, ProgressListener>> listeners_;
  ListenerId next_listener_{1};
};

struct ExecutionStats {
  std::size_t total{0};
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t running{0};
  std::size_t pending{0};
  std::size_t cancelled{0};
  double success_rate{0.0};
  double average_duration_seconds{0.0};
};

// success_rate is completed / finished; 0 when nothing has finished.
[[nodiscard]] auto compute_execution_stats(std::span<const Task> tasks)
    -> ExecutionStats;

} // namespace goalflow
