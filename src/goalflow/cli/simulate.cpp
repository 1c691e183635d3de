#include "goalflow/cli/commands.hpp"
#include "goalflow/cli/formatting.hpp"
#include "goalflow/config/config.hpp"
#include "goalflow/executor/capability.hpp"
#include "goalflow/orchestrator/orchestrator.hpp"
#include "goalflow/orchestrator/report.hpp"
#include "goalflow/plan/plan_codec.hpp"
#include "goalflow/util/json.hpp"
#include "goalflow/util/log.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <print>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace goalflow::cli {

namespace {

// Echoes task params back as output. `simulate_delay_ms` sleeps first and
// `simulate_error` turns the call into a failure with that message.
auto simulated_handler(const JsonMap &params) -> InvokeResult {
  if (auto it = params.find("simulate_delay_ms"); it != params.end()) {
    if (auto ms = json_number(it->second); ms && *ms > 0) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(static_cast<std::int64_t>(*ms)));
    }
  }
  if (auto it = params.find("simulate_error");
      it != params.end() && it->second.is_string()) {
    return std::unexpected(it->second.get<std::string>());
  }
  return to_json(params);
}

auto register_simulated(CapabilityRegistry &registry,
                        const std::vector<Task> &tasks) -> void {
  std::set<std::string> names;
  for (const auto &task : tasks) {
    names.insert(task.capability);
  }
  for (const auto &name : names) {
    if (registry.has_capability(name)) {
      continue;
    }
    if (auto r = registry.register_capability(name, &simulated_handler); !r) {
      log::warn("Cannot register simulated capability '{}': {}", name,
                r.error().message());
    }
  }
}

// Replays task lists read from files instead of asking a model.
class FilePlanner final : public IPlanner {
public:
  FilePlanner(std::vector<Task> plan, std::optional<std::vector<Task>> revision)
      : plan_(std::move(plan)), revision_(std::move(revision)) {}

  auto generate_plan(const Goal &goal,
                     std::span<const std::string> capabilities)
      -> Result<std::vector<Task>> override {
    log::debug("Planning goal {} against {} capabilities", goal.id,
               capabilities.size());
    return ok(plan_);
  }

  auto revise_plan(const Plan &plan, const FailureContext &context)
      -> Result<std::vector<Task>> override {
    if (!revision_) {
      log::info("No revision available for plan {} (task {} failed)", plan.id,
                context.failed_task);
      return ok(std::vector<Task>{});
    }
    auto revised = std::move(*revision_);
    revision_.reset();
    return ok(std::move(revised));
  }

private:
  std::vector<Task> plan_;
  std::optional<std::vector<Task>> revision_;
};

auto print_report(const GoalReport &report) -> void {
  std::println("{} {}", fmt::ansi::bold("Goal:"), report.goal.description);
  std::println("{} {} ({})", fmt::ansi::bold("Plan:"), report.plan.id,
               to_string_view(report.plan.status));

  if (report.awaiting_approval) {
    std::println("{} plan of {} tasks awaits approval; nothing was run",
                 fmt::ansi::yellow("!"), report.plan.tasks.size());
    return;
  }

  std::println("");
  fmt::Table results({{"TASK", 20},
                      {"CAPABILITY", 18},
                      {"RESULT", 9},
                      {"TIME", 9, true},
                      {"ERROR", 40}});
  results.print_header();
  for (const auto &result : report.results) {
    results.print_row({result.task_id.str(), result.capability,
                       result.success ? fmt::ansi::green("ok")
                                      : fmt::ansi::red("failed"),
                       fmt::format_duration(result.duration_seconds()),
                       result.error});
  }

  std::println("");
  fmt::Table tasks({{"TASK", 20}, {"STATUS", 12}, {"DEPENDS ON", 40}});
  tasks.print_header();
  for (const auto &task : report.plan.tasks) {
    std::string deps;
    for (const auto &dep : task.dependencies) {
      if (!deps.empty()) {
        deps += ", ";
      }
      deps += dep.str();
    }
    tasks.print_row(
        {task.id.str(),
         fmt::colorize_task_status(to_string_view(task.status)), deps});
  }

  std::println("");
  if (report.fatal_error) {
    std::println("{} {}: {}", fmt::ansi::red("Fatal:"),
                 report.fatal_error.message(), report.fatal_detail);
  }
  if (report.plan_evaluation) {
    const auto &eval = *report.plan_evaluation;
    std::println("Success rate: {:.0f}%  confidence: {:.2f}",
                 eval.success_rate * 100.0, eval.confidence);
    for (const auto &issue : eval.issues) {
      std::println("  - {}", issue);
    }
  }
  std::println("Replanning attempts: {}", report.replanning_attempts);
  std::println("Result: {}", report.success ? fmt::ansi::green("SUCCESS")
                                            : fmt::ansi::red("FAILED"));
}

} // namespace

auto cmd_simulate(const SimulateOptions &opts) -> int {
  log::set_output_stderr();

  EngineConfig config{};
  if (!opts.config_file.empty()) {
    std::string diagnostic;
    auto loaded = ConfigLoader::load_from_file(opts.config_file, &diagnostic);
    if (!loaded) {
      std::println(stderr, "Error: {}: {}", loaded.error().message(),
                   diagnostic);
      return 1;
    }
    config = std::move(*loaded);
    if (auto r = apply_logging(config.logging); !r) {
      std::println(stderr, "Error: cannot apply logging settings: {}",
                   r.error().message());
      return 1;
    }
  }
  if (opts.log_level) {
    log::set_level(*opts.log_level);
  }
  if (opts.trust_level &&
      !util::try_parse_enum(*opts.trust_level,
                            config.orchestrator.trust_level)) {
    std::println(stderr, "Error: unknown trust level '{}'", *opts.trust_level);
    return 1;
  }

  std::string diagnostic;
  auto doc = PlanCodec::load_from_file(opts.plan_file, &diagnostic);
  if (!doc) {
    std::println(stderr, "Error: {}: {}", doc.error().message(), diagnostic);
    return 1;
  }

  std::optional<std::vector<Task>> revision;
  if (opts.revision_file) {
    auto rev = PlanCodec::load_from_file(*opts.revision_file, &diagnostic);
    if (!rev) {
      std::println(stderr, "Error: {}: {}", rev.error().message(),
                   diagnostic);
      return 1;
    }
    revision = std::move(rev->tasks);
  }

  CapabilityRegistry registry;
  register_simulated(registry, doc->tasks);
  if (revision) {
    register_simulated(registry, *revision);
  }

  Goal goal{.id = generate_goal_id(),
            .description = doc->goal.empty()
                               ? std::filesystem::path(opts.plan_file)
                                     .stem()
                                     .string()
                               : doc->goal,
            .constraints = {},
            .context = {},
            .priority = 5,
            .created_at = util::Clock::now()};

  FilePlanner planner(std::move(doc->tasks), std::move(revision));
  GoalOrchestrator orchestrator(planner, registry, config);

  log::start();
  auto report = orchestrator.execute_goal(goal, &diagnostic);
  log::stop();

  if (!report) {
    if (opts.json) {
      JsonValue output{{"error", report.error().message()},
                       {"detail", diagnostic}};
      std::println("{}", dump_json(output));
    } else {
      std::println(stderr, "Error: {}: {}", report.error().message(),
                   diagnostic);
    }
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(to_json(*report)));
  } else {
    print_report(*report);
  }
  if (report->awaiting_approval) {
    return 0;
  }
  return report->success ? 0 : 1;
}

} // namespace goalflow::cli
