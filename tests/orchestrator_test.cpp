#include "goalflow/orchestrator/orchestrator.hpp"
#include "goalflow/orchestrator/report.hpp"
#include "goalflow/reflection/episode_learner.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace goalflow;
using goalflow::test::make_goal;
using goalflow::test::make_task;
using goalflow::test::RecordingInvoker;
using goalflow::test::ScriptedPlanner;

using namespace std::chrono_literals;

namespace {

class ThrowingPlanner final : public IPlanner {
public:
  auto generate_plan(const Goal &, std::span<const std::string>)
      -> Result<std::vector<Task>> override {
    throw std::runtime_error("model offline");
  }
  auto revise_plan(const Plan &, const FailureContext &)
      -> Result<std::vector<Task>> override {
    throw std::runtime_error("model offline");
  }
};

class ErrorPlanner final : public IPlanner {
public:
  auto generate_plan(const Goal &, std::span<const std::string>)
      -> Result<std::vector<Task>> override {
    return fail(Error::Timeout);
  }
  auto revise_plan(const Plan &, const FailureContext &)
      -> Result<std::vector<Task>> override {
    return fail(Error::Timeout);
  }
};

auto config_with(int max_replans) -> EngineConfig {
  EngineConfig config;
  config.orchestrator.max_replanning_attempts = max_replans;
  return config;
}

auto status_of(const Plan &plan, std::string_view id) -> TaskStatus {
  auto it = std::ranges::find_if(
      plan.tasks, [id](const Task &t) { return t.id.value() == id; });
  EXPECT_NE(it, plan.tasks.end()) << "no task " << id;
  return it == plan.tasks.end() ? TaskStatus::Pending : it->status;
}

auto has_task(const Plan &plan, std::string_view id) -> bool {
  return std::ranges::any_of(
      plan.tasks, [id](const Task &t) { return t.id.value() == id; });
}

// A -> B -> C, where B fetches over the network.
auto chain_plan() -> std::vector<Task> {
  return {make_task("A"), make_task("B", "fetch", {"A"}),
          make_task("C", "echo", {"B"})};
}

} // namespace

class GoalOrchestratorTest : public ::testing::Test {
protected:
  RecordingInvoker invoker_{"echo", "fetch", "fetch_mirror"};
};

TEST_F(GoalOrchestratorTest, ExecutesPlanInDependencyOrder) {
  ScriptedPlanner planner(chain_plan());
  EpisodeLearner learner;
  GoalOrchestrator orchestrator(planner, invoker_, {}, {}, &learner);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->success);
  EXPECT_FALSE(report->awaiting_approval);
  EXPECT_EQ(report->replanning_attempts, 0);
  EXPECT_EQ(report->plan.status, PlanStatus::Completed);
  EXPECT_FALSE(report->plan.id.empty());
  EXPECT_EQ(report->plan.goal_id, GoalId{"goal_test"});
  EXPECT_EQ(invoker_.calls(),
            (std::vector<std::string>{"echo", "fetch", "echo"}));

  ASSERT_EQ(report->results.size(), 3);
  EXPECT_EQ(report->results[0].task_id, TaskId{"A"});
  EXPECT_EQ(report->results[2].task_id, TaskId{"C"});
  for (const auto &task : report->plan.tasks) {
    EXPECT_EQ(task.status, TaskStatus::Completed);
    EXPECT_EQ(task.plan_id, report->plan.id);
  }

  ASSERT_TRUE(report->plan_evaluation.has_value());
  EXPECT_TRUE(report->plan_evaluation->success);
  EXPECT_TRUE(report->task_evaluations.empty());
  EXPECT_TRUE(report->episode_id.has_value());
  EXPECT_FALSE(report->fatal_error);

  EXPECT_EQ(planner.generate_calls, 1);
  EXPECT_EQ(planner.revise_calls, 0);
  EXPECT_EQ(planner.seen_capabilities,
            (std::vector<std::string>{"echo", "fetch", "fetch_mirror"}));
  EXPECT_EQ(learner.episodes_seen(), 1);
}

TEST_F(GoalOrchestratorTest, ReplansAroundNetworkFailure) {
  invoker_.fail_with("fetch", "Connection refused");
  ScriptedPlanner planner(chain_plan());
  planner.add_revision({make_task("B2", "fetch_mirror", {"A"}),
                        make_task("C", "echo", {"B2"})});
  GoalOrchestrator orchestrator(planner, invoker_, config_with(1));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->success);
  EXPECT_EQ(report->replanning_attempts, 1);
  EXPECT_EQ(planner.revise_calls, 1);

  ASSERT_EQ(planner.contexts.size(), 1);
  const auto &context = planner.contexts[0];
  EXPECT_EQ(context.failed_task, TaskId{"B"});
  EXPECT_EQ(context.error, "Connection refused");
  EXPECT_EQ(context.attempt, 1);
  EXPECT_TRUE(context.evaluation.should_replan);
  EXPECT_EQ(context.evaluation.category, FailureCategory::Network);
  EXPECT_EQ(context.results.size(), 2);

  EXPECT_FALSE(has_task(report->plan, "B"));
  EXPECT_EQ(status_of(report->plan, "A"), TaskStatus::Completed);
  EXPECT_EQ(status_of(report->plan, "B2"), TaskStatus::Completed);
  EXPECT_EQ(status_of(report->plan, "C"), TaskStatus::Completed);
  EXPECT_EQ(invoker_.call_count("echo"), 2);

  // The superseded failure stays in the history.
  ASSERT_EQ(report->results.size(), 4);
  EXPECT_EQ(report->results[1].task_id, TaskId{"B"});
  EXPECT_FALSE(report->results[1].success);
  ASSERT_EQ(report->task_evaluations.size(), 1);
}

TEST_F(GoalOrchestratorTest, ReplanningStopsAtAttemptLimit) {
  invoker_.fail_with("fetch", "Connection refused");
  ScriptedPlanner planner(chain_plan());
  planner.add_revision(
      {make_task("B2", "fetch", {"A"}), make_task("C", "echo", {"B2"})});
  planner.add_revision(
      {make_task("B3", "fetch_mirror", {"A"}), make_task("C", "echo", {"B3"})});
  GoalOrchestrator orchestrator(planner, invoker_, config_with(1));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(planner.revise_calls, 1);
  EXPECT_EQ(report->replanning_attempts, 1);
  EXPECT_EQ(report->task_evaluations.size(), 2);

  EXPECT_EQ(report->fatal_error, make_error_code(Error::StuckPlan));
  EXPECT_EQ(report->blocked_tasks, std::vector<TaskId>{TaskId{"C"}});
  EXPECT_EQ(status_of(report->plan, "B2"), TaskStatus::Failed);
  EXPECT_EQ(status_of(report->plan, "C"), TaskStatus::Cancelled);
  EXPECT_EQ(report->plan.status, PlanStatus::Failed);
  EXPECT_EQ(invoker_.call_count("fetch_mirror"), 0);
}

TEST_F(GoalOrchestratorTest, PermanentFailureIsNotReplanned) {
  invoker_.fail_with("fetch", "permission denied");
  ScriptedPlanner planner({make_task("A"), make_task("B", "fetch")});
  GoalOrchestrator orchestrator(planner, invoker_);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(planner.revise_calls, 0);
  EXPECT_EQ(report->replanning_attempts, 0);
  EXPECT_FALSE(report->fatal_error);
  EXPECT_EQ(report->plan.status, PlanStatus::Failed);
  ASSERT_EQ(report->task_evaluations.size(), 1);
  EXPECT_FALSE(report->task_evaluations[0].should_replan);
  ASSERT_TRUE(report->plan_evaluation.has_value());
  EXPECT_FALSE(report->plan_evaluation->success);
}

TEST_F(GoalOrchestratorTest, DisabledReflectionNeverReplans) {
  invoker_.fail_with("fetch", "Connection refused");
  ScriptedPlanner planner({make_task("B", "fetch")});
  auto config = config_with(3);
  config.orchestrator.enable_reflection = false;
  GoalOrchestrator orchestrator(planner, invoker_, config);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(planner.revise_calls, 0);
  EXPECT_TRUE(report->plan_evaluation.has_value());
}

TEST_F(GoalOrchestratorTest, EmptyRevisionLeavesFailureInPlace) {
  invoker_.fail_with("fetch", "network unreachable");
  ScriptedPlanner planner({make_task("B", "fetch")});
  GoalOrchestrator orchestrator(planner, invoker_, config_with(3));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(planner.revise_calls, 1);
  EXPECT_EQ(report->replanning_attempts, 1);
  EXPECT_FALSE(report->fatal_error);
  EXPECT_EQ(status_of(report->plan, "B"), TaskStatus::Failed);
}

TEST_F(GoalOrchestratorTest, RevisionErrorCountsAsAttempt) {
  invoker_.fail_with("fetch", "network unreachable");
  ScriptedPlanner planner({make_task("B", "fetch")});
  planner.add_revision_error(Error::PlanUnavailable);
  GoalOrchestrator orchestrator(planner, invoker_, config_with(3));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->replanning_attempts, 1);
  EXPECT_FALSE(report->success);
}

TEST_F(GoalOrchestratorTest, InvalidRevisionStopsExecution) {
  invoker_.fail_with("fetch", "Connection refused");
  ScriptedPlanner planner(chain_plan());
  planner.add_revision({make_task("B2", "fetch_mirror", {"ghost"}),
                        make_task("C", "echo", {"B2"})});
  GoalOrchestrator orchestrator(planner, invoker_, config_with(2));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_TRUE(report->fatal_error);
  EXPECT_TRUE(report->fatal_detail.starts_with("invalid revision"));
  EXPECT_NE(report->fatal_detail.find("ghost"), std::string::npos);
  EXPECT_EQ(report->plan.status, PlanStatus::Failed);
  // The rejected revision never reached the plan.
  EXPECT_TRUE(has_task(report->plan, "B"));
  EXPECT_FALSE(has_task(report->plan, "B2"));
  EXPECT_EQ(status_of(report->plan, "C"), TaskStatus::Cancelled);
  EXPECT_EQ(invoker_.call_count("fetch_mirror"), 0);
}

TEST_F(GoalOrchestratorTest, ParanoidTrustStopsBeforeExecution) {
  ScriptedPlanner planner(chain_plan());
  GoalOrchestrator orchestrator(planner, invoker_);

  auto report = orchestrator.execute_goal(make_goal(), TrustLevel::Paranoid);
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->awaiting_approval);
  EXPECT_FALSE(report->success);
  EXPECT_TRUE(report->results.empty());
  EXPECT_EQ(report->plan.status, PlanStatus::Draft);
  EXPECT_EQ(report->plan.tasks.size(), 3);
  EXPECT_FALSE(report->plan_evaluation.has_value());
  EXPECT_EQ(invoker_.call_count(), 0);
}

TEST_F(GoalOrchestratorTest, ConfiguredTrustLevelIsDefault) {
  ScriptedPlanner planner(chain_plan());
  EngineConfig config;
  config.orchestrator.trust_level = TrustLevel::Paranoid;
  GoalOrchestrator orchestrator(planner, invoker_, config);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->awaiting_approval);

  auto autonomous =
      orchestrator.execute_goal(make_goal(), TrustLevel::Autonomous);
  ASSERT_TRUE(autonomous.has_value());
  EXPECT_TRUE(autonomous->success);
}

TEST_F(GoalOrchestratorTest, CyclicPlanIsRejected) {
  ScriptedPlanner planner({make_task("A", "echo", {"B"}),
                           make_task("B", "echo", {"A"})});
  GoalOrchestrator orchestrator(planner, invoker_);

  std::string diagnostic;
  auto report = orchestrator.execute_goal(make_goal(), &diagnostic);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::CycleDetected));
  EXPECT_FALSE(diagnostic.empty());
  EXPECT_EQ(invoker_.call_count(), 0);
}

TEST_F(GoalOrchestratorTest, DuplicateTaskIdsAreRejected) {
  ScriptedPlanner planner({make_task("A"), make_task("A")});
  GoalOrchestrator orchestrator(planner, invoker_);
  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::DuplicateTask));
}

TEST_F(GoalOrchestratorTest, EmptyPlanIsUnavailable) {
  ScriptedPlanner planner;
  GoalOrchestrator orchestrator(planner, invoker_);
  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::PlanUnavailable));
}

TEST_F(GoalOrchestratorTest, PlannerFailuresAreReported) {
  ThrowingPlanner throwing;
  GoalOrchestrator first(throwing, invoker_);
  std::string diagnostic;
  auto report = first.execute_goal(make_goal(), &diagnostic);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::PlanUnavailable));
  EXPECT_NE(diagnostic.find("model offline"), std::string::npos);

  ErrorPlanner erroring;
  GoalOrchestrator second(erroring, invoker_);
  auto again = second.execute_goal(make_goal());
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::Timeout));
}

TEST_F(GoalOrchestratorTest, PlannerThrowingDuringRevisionKeepsFailure) {
  class RevisionThrows final : public IPlanner {
  public:
    auto generate_plan(const Goal &, std::span<const std::string>)
        -> Result<std::vector<Task>> override {
      return ok(std::vector<Task>{make_task("B", "fetch")});
    }
    auto revise_plan(const Plan &, const FailureContext &)
        -> Result<std::vector<Task>> override {
      throw std::runtime_error("model offline");
    }
  };
  invoker_.fail_with("fetch", "Connection refused");
  RevisionThrows planner;
  GoalOrchestrator orchestrator(planner, invoker_);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(report->replanning_attempts, 1);
  EXPECT_FALSE(report->fatal_error);
}

TEST_F(GoalOrchestratorTest, PlannerNonStandardExceptionsAreContained) {
  class ThrowsInt final : public IPlanner {
  public:
    explicit ThrowsInt(bool on_generate) : on_generate_(on_generate) {}
    auto generate_plan(const Goal &, std::span<const std::string>)
        -> Result<std::vector<Task>> override {
      if (on_generate_) {
        throw 42;
      }
      return ok(std::vector<Task>{make_task("B", "fetch")});
    }
    auto revise_plan(const Plan &, const FailureContext &)
        -> Result<std::vector<Task>> override {
      throw 42;
    }

  private:
    bool on_generate_;
  };

  ThrowsInt at_generate(true);
  GoalOrchestrator first(at_generate, invoker_);
  std::string diagnostic;
  auto report = first.execute_goal(make_goal(), &diagnostic);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::PlanUnavailable));
  EXPECT_NE(diagnostic.find("planner error"), std::string::npos);
  EXPECT_EQ(invoker_.call_count(), 0);

  invoker_.fail_with("fetch", "Connection refused");
  ThrowsInt at_revise(false);
  GoalOrchestrator second(at_revise, invoker_);
  auto revised = second.execute_goal(make_goal());
  ASSERT_TRUE(revised.has_value());
  EXPECT_FALSE(revised->success);
  EXPECT_EQ(revised->replanning_attempts, 1);
  EXPECT_FALSE(revised->fatal_error);
  EXPECT_EQ(status_of(revised->plan, "B"), TaskStatus::Failed);
}

TEST_F(GoalOrchestratorTest, CancelRequestStopsBetweenWaves) {
  ScriptedPlanner planner(chain_plan());
  GoalOrchestrator *self = nullptr;
  int cancels = 0;
  EngineHooks hooks;
  hooks.on_task_started = [&self, &cancels](const Task &task) {
    if (task.id == TaskId{"A"} && cancels++ == 0) {
      self->request_cancel();
    }
  };
  GoalOrchestrator orchestrator(planner, invoker_, {}, std::move(hooks));
  self = &orchestrator;

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->success);
  EXPECT_EQ(report->plan.status, PlanStatus::Cancelled);
  EXPECT_EQ(status_of(report->plan, "A"), TaskStatus::Completed);
  EXPECT_EQ(status_of(report->plan, "B"), TaskStatus::Cancelled);
  EXPECT_EQ(status_of(report->plan, "C"), TaskStatus::Cancelled);
  EXPECT_EQ(invoker_.call_count(), 1);

  // The flag is reset for the next goal.
  auto next = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(next.has_value());
  EXPECT_TRUE(next->success);
  EXPECT_EQ(next->plan.status, PlanStatus::Completed);
  EXPECT_EQ(invoker_.call_count(), 4);
}

TEST_F(GoalOrchestratorTest, HooksFireInOrderAndMayThrow) {
  ScriptedPlanner planner({make_task("A"), make_task("B", "fetch", {"A"})});
  std::vector<std::string> seen;
  EngineHooks hooks;
  hooks.on_plan_created = [&seen](const Plan &) {
    seen.emplace_back("plan_created");
    throw std::runtime_error("observer bug");
  };
  hooks.on_task_started = [&seen](const Task &task) {
    seen.push_back("started:" + task.id.str());
    throw std::runtime_error("observer bug");
  };
  hooks.on_task_completed = [&seen](const Task &task, const TaskResult &) {
    seen.push_back("completed:" + task.id.str());
    throw 7;
  };
  hooks.on_task_failed = [&seen](const Task &task, const TaskResult &) {
    seen.push_back("failed:" + task.id.str());
  };
  hooks.on_episode_recorded = [&seen](const Episode &) {
    seen.emplace_back("episode");
  };
  hooks.on_plan_evaluated = [&seen](const Evaluation &) {
    seen.emplace_back("evaluated");
  };
  GoalOrchestrator orchestrator(planner, invoker_, {}, std::move(hooks));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->success);
  EXPECT_EQ(seen, (std::vector<std::string>{
                      "plan_created", "started:A", "completed:A", "started:B",
                      "completed:B", "episode", "evaluated"}));
}

TEST_F(GoalOrchestratorTest, WaveConcurrencyIsBounded) {
  invoker_.sleep_then_succeed("echo", 20ms);
  std::vector<Task> tasks;
  for (int i = 0; i < 6; ++i) {
    tasks.push_back(make_task(std::format("t{}", i)));
  }
  ScriptedPlanner planner(tasks);
  EngineConfig config;
  config.orchestrator.max_concurrent_tasks = 2;
  GoalOrchestrator orchestrator(planner, invoker_, config);

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->success);
  EXPECT_EQ(report->results.size(), 6);
  EXPECT_LE(invoker_.max_in_flight(), 2);
}

TEST_F(GoalOrchestratorTest, ReportSerializesToJson) {
  invoker_.fail_with("fetch", "Connection refused");
  ScriptedPlanner planner(chain_plan());
  GoalOrchestrator orchestrator(planner, invoker_, config_with(0));

  auto report = orchestrator.execute_goal(make_goal());
  ASSERT_TRUE(report.has_value());
  auto json = to_json(*report);
  ASSERT_TRUE(json.is_object());
  const auto &obj = json.get_object();

  EXPECT_FALSE(obj.at("success").get<bool>());
  EXPECT_EQ(obj.at("replanning_attempts").as<std::int64_t>(), 0);
  EXPECT_EQ(obj.at("results").get_array().size(), 2);
  EXPECT_EQ(obj.at("task_evaluations").get_array().size(), 1);
  EXPECT_TRUE(obj.at("plan_evaluation").is_object());
  EXPECT_TRUE(obj.at("episode_id").is_string());
  EXPECT_EQ(obj.at("fatal_error").get<std::string>(),
            "plan is stuck: no task can make progress");
  ASSERT_EQ(obj.at("blocked_tasks").get_array().size(), 1);
  EXPECT_EQ(obj.at("blocked_tasks").get_array()[0].get<std::string>(), "C");

  const auto &evaluation = obj.at("task_evaluations").get_array()[0];
  EXPECT_EQ(evaluation.get_object().at("category").get<std::string>(),
            "network");
  EXPECT_EQ(evaluation.get_object().at("task_id").get<std::string>(), "B");
}
