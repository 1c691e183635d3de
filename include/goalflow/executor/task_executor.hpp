#pragma once

#include "goalflow/core/constants.hpp"
#include "goalflow/executor/capability.hpp"
#include "goalflow/monitor/performance_monitor.hpp"
#include "goalflow/monitor/progress_tracker.hpp"
#include "goalflow/monitor/task_monitor.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/thread_pool.hpp>
#include <boost/describe/enum.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace goalflow {

enum class ProgressEvent : std::uint8_t {
  Started,
  Completed,
  Failed,
  Timeout,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(ProgressEvent, Started, Completed, Failed, Timeout,
                    Cancelled)
GOALFLOW_DEFINE_ENUM_SERDE(ProgressEvent, ProgressEvent::Started)

struct ProgressInfo {
  TaskId task_id;
  std::string capability;
  ProgressEvent event{ProgressEvent::Started};
  std::string message;
};

// May be called concurrently from several dispatcher threads during
// run_many(). Exceptions are logged and otherwise ignored.
using ProgressCallback = std::function<void(const ProgressInfo &info)>;

struct RetryPolicy {
  int max_retries{orchestrator_defaults::kMaxRetries};
  std::chrono::milliseconds retry_delay{orchestrator_defaults::kRetryDelay};
};

struct ExecutorOptions {
  std::size_t max_workers{executor_defaults::kMaxWorkers};
  std::chrono::milliseconds default_timeout{executor_defaults::kTaskTimeout};
  // Advisory only: reported, never enforced.
  std::size_t max_memory_mb{executor_defaults::kMaxMemoryMb};
  double max_cpu_percent{executor_defaults::kMaxCpuPercent};
};

// Runs tasks against a capability catalog on a bounded worker pool.
// Failures of any kind come back as failed TaskResults; nothing here throws
// to the caller. Destruction performs shutdown(false).
class TaskExecutor {
public:
  explicit TaskExecutor(ICapabilityInvoker &invoker,
                        ExecutorOptions options = {});
  ~TaskExecutor();

  TaskExecutor(const TaskExecutor &) = delete;
  auto operator=(const TaskExecutor &) -> TaskExecutor & = delete;

  [[nodiscard]] auto
  run_one(const Task &task,
          std::optional<std::chrono::milliseconds> timeout = std::nullopt,
          const ProgressCallback &on_progress = {}) -> TaskResult;

  [[nodiscard]] auto
  run_with_retry(const Task &task, int max_retries,
                 std::chrono::milliseconds retry_delay,
                 const ProgressCallback &on_progress = {},
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> TaskResult;

  // Results are positionally aligned with `tasks`.
  [[nodiscard]] auto run_many(std::span<const Task> tasks,
                              std::size_t max_concurrency,
                              RetryPolicy retry = {},
                              const ProgressCallback &on_progress = {})
      -> std::vector<TaskResult>;

  // Cooperative: honored just before and just after the next invocation of
  // the task; a running invocation is never interrupted.
  auto cancel(const TaskId &task_id) -> void;
  [[nodiscard]] auto is_cancelled(const TaskId &task_id) const -> bool;

  // wait=true drains queued invocations; wait=false drops the ones that have
  // not started. Either way running invocations are joined.
  auto shutdown(bool wait = true) -> void;
  [[nodiscard]] auto is_shutdown() const noexcept -> bool {
    return shutdown_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto monitor() noexcept -> TaskMonitor & { return monitor_; }
  [[nodiscard]] auto progress() noexcept -> ProgressTracker & {
    return progress_;
  }
  [[nodiscard]] auto performance() noexcept -> PerformanceMonitor & {
    return performance_;
  }
  [[nodiscard]] auto options() const noexcept -> const ExecutorOptions & {
    return options_;
  }

private:
  [[nodiscard]] auto execute(const Task &task,
                             std::chrono::milliseconds timeout,
                             const ProgressCallback &on_progress)
      -> TaskResult;
  [[nodiscard]] auto cancelled_result(const Task &task,
                                      const ProgressCallback &on_progress)
      -> TaskResult;
  auto consume_cancellation(const TaskId &task_id) -> bool;
  auto emit(const ProgressCallback &on_progress, const Task &task,
            ProgressEvent event, std::string message = {}) -> void;
  auto finish(const Task &task, const TaskResult &result) -> void;

  ICapabilityInvoker &invoker_;
  ExecutorOptions options_;

  TaskMonitor monitor_;
  ProgressTracker progress_;
  PerformanceMonitor performance_;

  mutable std::mutex cancel_mu_;
  ankerl::unordered_dense::set<TaskId> cancel_requests_;

  std::mutex sleep_mu_;
  std::condition_variable sleep_cv_;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> dropping_{false};
  boost::asio::thread_pool pool_;
};

} // namespace goalflow
