#include "goalflow/executor/task_executor.hpp"

#include "goalflow/util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace goalflow {
namespace {

[[nodiscard]] auto normalize(ExecutorOptions options) -> ExecutorOptions {
  options.max_workers = std::max<std::size_t>(1, options.max_workers);
  if (options.default_timeout <= std::chrono::milliseconds::zero()) {
    options.default_timeout = executor_defaults::kTaskTimeout;
  }
  return options;
}

[[nodiscard]] auto format_seconds(std::chrono::milliseconds d) -> std::string {
  return std::format("{:g}s", std::chrono::duration<double>(d).count());
}

enum class Dispatch : std::uint8_t { Queued, Running, Abandoned };

[[nodiscard]] auto to_millis(std::chrono::steady_clock::duration d)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

[[nodiscard]] auto to_progress_status(ProgressEvent event) -> ProgressStatus {
  switch (event) {
  case ProgressEvent::Started:
    return ProgressStatus::Starting;
  case ProgressEvent::Completed:
    return ProgressStatus::Completed;
  case ProgressEvent::Failed:
  case ProgressEvent::Timeout:
    return ProgressStatus::Failed;
  case ProgressEvent::Cancelled:
    return ProgressStatus::Cancelled;
  }
  return ProgressStatus::Failed;
}

} // namespace

TaskExecutor::TaskExecutor(ICapabilityInvoker &invoker, ExecutorOptions options)
    : invoker_(invoker), options_(normalize(options)),
      pool_(options_.max_workers) {
  log::info("TaskExecutor started: workers={} default_timeout={} "
            "memory_limit={}MB cpu_limit={}% (limits are advisory)",
            options_.max_workers, format_seconds(options_.default_timeout),
            options_.max_memory_mb, options_.max_cpu_percent);
}

TaskExecutor::~TaskExecutor() { shutdown(false); }

auto TaskExecutor::shutdown(bool wait) -> void {
  if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  {
    std::lock_guard lock(sleep_mu_);
  }
  sleep_cv_.notify_all();

  if (!wait) {
    dropping_.store(true, std::memory_order_release);
    pool_.stop();
  }
  pool_.join();
  log::info("TaskExecutor shut down (wait={})", wait);
}

auto TaskExecutor::cancel(const TaskId &task_id) -> void {
  {
    std::lock_guard lock(cancel_mu_);
    cancel_requests_.insert(task_id);
  }
  {
    std::lock_guard lock(sleep_mu_);
  }
  sleep_cv_.notify_all();
  log::info("Cancellation requested for task {}", task_id);
}

auto TaskExecutor::is_cancelled(const TaskId &task_id) const -> bool {
  std::lock_guard lock(cancel_mu_);
  return cancel_requests_.contains(task_id);
}

auto TaskExecutor::consume_cancellation(const TaskId &task_id) -> bool {
  std::lock_guard lock(cancel_mu_);
  return cancel_requests_.erase(task_id) > 0;
}

auto TaskExecutor::emit(const ProgressCallback &on_progress, const Task &task,
                        ProgressEvent event, std::string message) -> void {
  progress_.update(ProgressUpdate{
      .task_id = task.id,
      .status = to_progress_status(event),
      .progress = event == ProgressEvent::Started ? 0.0 : 1.0,
      .message = message,
      .timestamp = util::Clock::now(),
      .metadata = {}});

  if (!on_progress) {
    return;
  }
  try {
    on_progress(ProgressInfo{.task_id = task.id,
                             .capability = task.capability,
                             .event = event,
                             .message = std::move(message)});
  } catch (const std::exception &e) {
    log::warn("Progress callback for task {} threw: {}", task.id, e.what());
  } catch (...) {
    log::warn("Progress callback for task {} threw a non-standard exception",
              task.id);
  }
}

auto TaskExecutor::cancelled_result(const Task &task,
                                    const ProgressCallback &on_progress)
    -> TaskResult {
  auto result = make_failed_result(
      task.id, std::format("Task {} was cancelled", task.id));
  result.capability = task.capability;
  result.metadata.insert_or_assign(std::string(task_meta::kCancelled), true);
  emit(on_progress, task, ProgressEvent::Cancelled, result.error);
  log::info("Task {} cancelled", task.id);
  return result;
}

auto TaskExecutor::finish(const Task &task, const TaskResult &result)
    -> void {
  monitor_.end(task.id);
  performance_.record_metric(task.id, "execution_time",
                             result.duration_seconds(), "seconds");
}

auto TaskExecutor::run_one(const Task &task,
                           std::optional<std::chrono::milliseconds> timeout,
                           const ProgressCallback &on_progress) -> TaskResult {
  try {
    return execute(task, timeout.value_or(options_.default_timeout),
                   on_progress);
  } catch (const std::exception &e) {
    log::error("Task {} aborted with internal error: {}", task.id, e.what());
    monitor_.end(task.id);
    auto result = make_failed_result(
        task.id, std::format("Internal executor error: {}", e.what()));
    result.capability = task.capability;
    return result;
  } catch (...) {
    log::error("Task {} aborted with a non-standard internal error", task.id);
    monitor_.end(task.id);
    auto result = make_failed_result(
        task.id, "Internal executor error: non-standard exception");
    result.capability = task.capability;
    return result;
  }
}

auto TaskExecutor::execute(const Task &task, std::chrono::milliseconds timeout,
                           const ProgressCallback &on_progress) -> TaskResult {
  if (is_shutdown()) {
    auto result = make_failed_result(task.id, "Executor is shut down");
    result.capability = task.capability;
    return result;
  }
  if (consume_cancellation(task.id)) {
    return cancelled_result(task, on_progress);
  }

  monitor_.start(task.id);
  emit(on_progress, task, ProgressEvent::Started,
       std::format("invoking {}", task.capability));

  TaskResult result;
  result.task_id = task.id;
  result.capability = task.capability;
  result.started_at = util::Clock::now();
  result.logs.emplace_back(std::format("[{}] invoking capability '{}'",
                                       util::format_iso8601(result.started_at),
                                       task.capability));

  if (!invoker_.has_capability(task.capability)) {
    result.error = std::format("Capability not found: {}", task.capability);
    result.finished_at = util::Clock::now();
    result.duration = result.finished_at - result.started_at;
    monitor_.checkpoint(task.id, "capability_missing",
                        JsonValue{{"capability", task.capability}});
    finish(task, result);
    emit(on_progress, task, ProgressEvent::Failed, result.error);
    log::warn("Task {}: {}", task.id, result.error);
    return result;
  }

  // The invocation owns copies of everything it reads, so a timed-out call
  // can keep running after this frame is gone. Whoever moves `dispatch` out
  // of Queued first decides whether the capability runs at all.
  const auto timeout_ms = static_cast<std::int64_t>(timeout.count());
  auto dispatch = std::make_shared<std::atomic<Dispatch>>(Dispatch::Queued);
  auto future = boost::asio::post(
      pool_, boost::asio::use_future(
                 [dispatch, invoker = &invoker_, capability = task.capability,
                  params = task.params]() -> InvokeResult {
                   auto queued = Dispatch::Queued;
                   if (!dispatch->compare_exchange_strong(
                           queued, Dispatch::Running,
                           std::memory_order_acq_rel)) {
                     return std::unexpected(
                         std::string("invocation abandoned before start"));
                   }
                   return invoker->invoke(capability, params);
                 }));
  monitor_.checkpoint(task.id, "invoke_posted",
                      JsonValue{{"capability", task.capability},
                                {"timeout_ms", timeout_ms}});

  const auto steady_start = std::chrono::steady_clock::now();
  const auto deadline = steady_start + timeout;
  auto status = std::future_status::timeout;
  for (;;) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, timing::kShutdownPollInterval);
    status = future.wait_for(slice);
    if (status == std::future_status::ready ||
        dropping_.load(std::memory_order_acquire)) {
      break;
    }
  }

  // Claim a queued invocation so it never runs after this result is reported.
  auto abandon = [&dispatch] {
    auto queued = Dispatch::Queued;
    return dispatch->compare_exchange_strong(queued, Dispatch::Abandoned,
                                             std::memory_order_acq_rel);
  };

  if (status != std::future_status::ready &&
      dropping_.load(std::memory_order_acquire)) {
    const bool never_started = abandon();
    result.finished_at = util::Clock::now();
    result.duration = std::chrono::steady_clock::now() - steady_start;
    result.error = "Executor is shut down";
    monitor_.checkpoint(task.id, "dropped",
                        JsonValue{{"started", !never_started}});
    finish(task, result);
    emit(on_progress, task, ProgressEvent::Failed, result.error);
    return result;
  }

  if (status != std::future_status::ready) {
    const bool never_started = abandon();
    result.finished_at = util::Clock::now();
    result.duration = std::chrono::steady_clock::now() - steady_start;
    if (never_started) {
      result.error = std::format(
          "Task execution timeout after {} (never started, all workers busy)",
          format_seconds(timeout));
      result.metadata.insert_or_assign(std::string(task_meta::kNotStarted),
                                       true);
    } else {
      result.error = std::format("Task execution timeout after {}",
                                 format_seconds(timeout));
    }
    result.metadata.insert_or_assign(std::string(task_meta::kTimedOut), true);
    result.logs.emplace_back(result.error);
    monitor_.checkpoint(task.id, "timeout",
                        JsonValue{{"timeout_ms", timeout_ms},
                                  {"started", !never_started}});
    finish(task, result);
    emit(on_progress, task, ProgressEvent::Timeout, result.error);
    log::warn("Task {} ({}) {} after {}", task.id, task.capability,
              never_started ? "was never started" : "timed out",
              format_seconds(timeout));
    return result;
  }

  try {
    auto invoked = future.get();
    if (invoked) {
      result.success = true;
      result.output = std::move(*invoked);
    } else {
      result.error = std::move(invoked.error());
    }
  } catch (const std::exception &e) {
    result.error = e.what();
  } catch (...) {
    result.error = "capability raised a non-standard exception";
  }
  if (!result.success && result.error.empty()) {
    result.error = "capability failed without an error message";
  }
  result.finished_at = util::Clock::now();
  result.duration = std::chrono::steady_clock::now() - steady_start;
  monitor_.checkpoint(task.id, "invoke_returned",
                      JsonValue{{"success", result.success},
                                {"elapsed_ms", to_millis(result.duration)}});
  finish(task, result);

  if (consume_cancellation(task.id)) {
    monitor_.checkpoint(task.id, "cancelled");
    return cancelled_result(task, on_progress);
  }

  if (result.success) {
    result.logs.emplace_back("completed");
    emit(on_progress, task, ProgressEvent::Completed);
    log::debug("Task {} completed in {:.3f}s", task.id,
               result.duration_seconds());
  } else {
    result.logs.emplace_back(std::format("failed: {}", result.error));
    emit(on_progress, task, ProgressEvent::Failed, result.error);
    log::info("Task {} ({}) failed: {}", task.id, task.capability,
              result.error);
  }
  return result;
}

auto TaskExecutor::run_with_retry(
    const Task &task, int max_retries, std::chrono::milliseconds retry_delay,
    const ProgressCallback &on_progress,
    std::optional<std::chrono::milliseconds> timeout) -> TaskResult {
  max_retries = std::max(0, max_retries);
  TaskResult last;

  for (int attempt = 0; attempt <= max_retries; ++attempt) {
    if (attempt > 0) {
      log::info("Retrying task {} (attempt {}/{}) in {}", task.id,
                attempt + 1, max_retries + 1, format_seconds(retry_delay));
      std::unique_lock lock(sleep_mu_);
      sleep_cv_.wait_for(lock, retry_delay,
                         [&] { return is_shutdown() || is_cancelled(task.id); });
    }

    last = run_one(task, timeout, on_progress);
    last.metadata.insert_or_assign(std::string(task_meta::kAttempts),
                                   static_cast<std::int64_t>(attempt + 1));
    if (last.success) {
      last.metadata.insert_or_assign(std::string(task_meta::kRetries),
                                     static_cast<std::int64_t>(attempt));
      return last;
    }
    if (last.cancelled() || is_shutdown()) {
      last.metadata.insert_or_assign(std::string(task_meta::kRetries),
                                     static_cast<std::int64_t>(attempt));
      return last;
    }
  }

  last.metadata.insert_or_assign(std::string(task_meta::kRetries),
                                 static_cast<std::int64_t>(max_retries));
  last.metadata.insert_or_assign(std::string(task_meta::kRetryExhausted),
                                 true);
  log::warn("Task {} failed after {} attempts: {}", task.id, max_retries + 1,
            last.error);
  return last;
}

auto TaskExecutor::run_many(std::span<const Task> tasks,
                            std::size_t max_concurrency, RetryPolicy retry,
                            const ProgressCallback &on_progress)
    -> std::vector<TaskResult> {
  std::vector<TaskResult> results(tasks.size());
  if (tasks.empty()) {
    return results;
  }

  const auto width = std::min(
      {std::max<std::size_t>(1, max_concurrency), options_.max_workers,
       tasks.size()});
  log::debug("Dispatching {} tasks with concurrency {}", tasks.size(), width);

  auto run_task = [&](const Task &task) -> TaskResult {
    if (retry.max_retries > 0) {
      return run_with_retry(task, retry.max_retries, retry.retry_delay,
                            on_progress);
    }
    return run_one(task, std::nullopt, on_progress);
  };

  std::atomic<std::size_t> next{0};
  {
    std::vector<std::jthread> dispatchers;
    dispatchers.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
      dispatchers.emplace_back([&] {
        for (;;) {
          const auto idx = next.fetch_add(1, std::memory_order_relaxed);
          if (idx >= tasks.size()) {
            break;
          }
          results[idx] = run_task(tasks[idx]);
        }
      });
    }
  }
  return results;
}

} // namespace goalflow
