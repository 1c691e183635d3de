#pragma once

#include "goalflow/executor/capability.hpp"
#include "goalflow/orchestrator/planner.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/id.hpp"
#include "goalflow/util/json.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace goalflow::test {

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto
make_task(std::string_view id, std::string_view capability = "echo",
          std::initializer_list<std::string_view> deps = {}) -> Task {
  Task task;
  task.id = TaskId{id};
  task.description = std::string(id);
  task.capability = std::string(capability);
  for (auto dep : deps) {
    task.dependencies.emplace_back(dep);
  }
  return task;
}

[[nodiscard]] inline auto make_goal(std::string_view description = "test goal")
    -> Goal {
  Goal goal;
  goal.id = GoalId{"goal_test"};
  goal.description = std::string(description);
  return goal;
}

[[nodiscard]] inline auto ok_result(std::string_view task_id,
                                    std::string capability = "echo")
    -> TaskResult {
  TaskResult r;
  r.task_id = TaskId{task_id};
  r.capability = std::move(capability);
  r.success = true;
  r.output = std::string("done");
  return r;
}

[[nodiscard]] inline auto failed_result(std::string_view task_id,
                                        std::string error,
                                        std::string capability = "echo")
    -> TaskResult {
  auto r = make_failed_result(TaskId{task_id}, std::move(error));
  r.capability = std::move(capability);
  return r;
}

// Capability catalog whose behavior is scripted per capability. Every call is
// recorded; unscripted capabilities that are declared echo their params.
class RecordingInvoker final : public ICapabilityInvoker {
public:
  using Behavior = std::function<InvokeResult(const JsonMap &params)>;

  RecordingInvoker() = default;
  RecordingInvoker(std::initializer_list<std::string_view> capabilities) {
    for (auto name : capabilities) {
      declare(name);
    }
  }

  auto declare(std::string_view name) -> void {
    std::lock_guard lock(mu_);
    behaviors_.insert_or_assign(std::string(name), Behavior{});
  }

  auto set(std::string_view name, Behavior behavior) -> void {
    std::lock_guard lock(mu_);
    behaviors_.insert_or_assign(std::string(name), std::move(behavior));
  }

  auto fail_with(std::string_view name, std::string message) -> void {
    set(name, [message = std::move(message)](const JsonMap &) -> InvokeResult {
      return std::unexpected(message);
    });
  }

  auto sleep_then_succeed(std::string_view name,
                          std::chrono::milliseconds delay) -> void {
    set(name, [delay](const JsonMap &params) -> InvokeResult {
      std::this_thread::sleep_for(delay);
      return to_json(params);
    });
  }

  auto invoke(std::string_view capability, const JsonMap &params)
      -> InvokeResult override {
    Behavior behavior;
    {
      std::lock_guard lock(mu_);
      calls_.emplace_back(capability);
      auto it = behaviors_.find(capability);
      if (it == behaviors_.end()) {
        return std::unexpected(
            std::string("Capability not found: ").append(capability));
      }
      behavior = it->second;
    }

    const auto now = in_flight_.fetch_add(1) + 1;
    auto seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }
    InvokeResult result =
        behavior ? behavior(params) : InvokeResult(to_json(params));
    in_flight_.fetch_sub(1);
    return result;
  }

  auto has_capability(std::string_view capability) const -> bool override {
    std::lock_guard lock(mu_);
    return behaviors_.find(capability) != behaviors_.end();
  }

  auto capabilities() const -> std::vector<std::string> override {
    std::lock_guard lock(mu_);
    std::vector<std::string> out;
    for (const auto &[name, _] : behaviors_) {
      out.push_back(name);
    }
    return out;
  }

  [[nodiscard]] auto call_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return calls_.size();
  }

  [[nodiscard]] auto call_count(std::string_view capability) const
      -> std::size_t {
    std::lock_guard lock(mu_);
    return static_cast<std::size_t>(std::ranges::count(calls_, capability));
  }

  [[nodiscard]] auto calls() const -> std::vector<std::string> {
    std::lock_guard lock(mu_);
    return calls_;
  }

  [[nodiscard]] auto max_in_flight() const -> int {
    return max_in_flight_.load();
  }

private:
  mutable std::mutex mu_;
  std::map<std::string, Behavior, std::less<>> behaviors_;
  std::vector<std::string> calls_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

// Planner that hands out a fixed plan and a queue of revisions.
class ScriptedPlanner final : public IPlanner {
public:
  explicit ScriptedPlanner(std::vector<Task> plan = {})
      : plan_(std::move(plan)) {}

  auto add_revision(std::vector<Task> tasks) -> void {
    revisions_.emplace_back(std::move(tasks));
  }
  auto add_revision_error(Error error) -> void {
    revisions_.emplace_back(std::unexpected(make_error_code(error)));
  }

  auto generate_plan(const Goal &, std::span<const std::string> capabilities)
      -> Result<std::vector<Task>> override {
    ++generate_calls;
    seen_capabilities.assign(capabilities.begin(), capabilities.end());
    return ok(plan_);
  }

  auto revise_plan(const Plan &plan, const FailureContext &context)
      -> Result<std::vector<Task>> override {
    ++revise_calls;
    contexts.push_back(context);
    plans_seen.push_back(plan);
    if (revisions_.empty()) {
      return ok(std::vector<Task>{});
    }
    auto next = std::move(revisions_.front());
    revisions_.pop_front();
    return next;
  }

  int generate_calls{0};
  int revise_calls{0};
  std::vector<std::string> seen_capabilities;
  std::vector<FailureContext> contexts;
  std::vector<Plan> plans_seen;

private:
  std::vector<Task> plan_;
  std::deque<Result<std::vector<Task>>> revisions_;
};

} // namespace goalflow::test
