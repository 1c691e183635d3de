#include "goalflow/cli/commands.hpp"
#include "goalflow/cli/formatting.hpp"
#include "goalflow/plan/plan_codec.hpp"
#include "goalflow/plan/plan_graph.hpp"
#include "goalflow/util/json.hpp"
#include "goalflow/util/log.hpp"

#include <cstdint>
#include <filesystem>
#include <print>
#include <string>
#include <vector>

namespace goalflow::cli {

namespace {

struct ValidationResult {
  std::size_t tasks{0};
  std::vector<std::vector<TaskId>> waves;
  bool valid{false};
  std::string error;
};

auto validate_plan_file(const std::string &path) -> ValidationResult {
  ValidationResult vr;
  std::string diagnostic;
  auto res =
      PlanCodec::load_from_file(path, &diagnostic)
          .and_then([&](auto &&doc) -> Result<PlanGraph> {
            if (doc.tasks.empty()) {
              diagnostic = "plan has no tasks";
              return fail(Error::EmptyPlan);
            }
            vr.tasks = doc.tasks.size();
            return PlanGraph::from_tasks(PlanId{"plan_validate"},
                                         GoalId{"goal_validate"},
                                         std::move(doc.tasks));
          })
          .and_then([&](const PlanGraph &graph)
                        -> Result<std::vector<std::vector<TaskId>>> {
            if (auto r = graph.validate(&diagnostic); !r) {
              return fail(r.error());
            }
            return graph.topological_waves();
          });

  vr.valid = res.has_value();
  if (vr.valid) {
    vr.waves = std::move(*res);
  } else {
    vr.error = diagnostic.empty() ? res.error().message() : diagnostic;
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  if (!std::filesystem::exists(opts.plan_file)) {
    std::println(stderr, "Error: File does not exist: {}", opts.plan_file);
    return 1;
  }

  auto vr = validate_plan_file(opts.plan_file);

  if (opts.json) {
    JsonValue waves = std::vector<JsonValue>{};
    for (const auto &wave : vr.waves) {
      JsonValue ids = std::vector<JsonValue>{};
      for (const auto &id : wave) {
        ids.get_array().emplace_back(id.str());
      }
      waves.get_array().emplace_back(std::move(ids));
    }
    JsonValue output{
        {"file", opts.plan_file},
        {"valid", vr.valid},
        {"tasks", static_cast<std::int64_t>(vr.tasks)},
        {"waves", std::move(waves)},
    };
    if (!vr.valid) {
      output.get_object().emplace("error", vr.error);
    }
    std::println("{}", dump_json(output));
    return vr.valid ? 0 : 1;
  }

  if (!vr.valid) {
    std::println("{} {} - {}", fmt::ansi::red("✗"), opts.plan_file,
                 fmt::ansi::red(vr.error));
    return 1;
  }

  std::println("{} {} - {} ({} tasks, {} waves)", fmt::ansi::green("✓"),
               opts.plan_file, fmt::ansi::green("Valid"), vr.tasks,
               vr.waves.size());
  fmt::Table table({{"WAVE", 6, true}, {"TASKS", 60}});
  table.print_header();
  for (std::size_t i = 0; i < vr.waves.size(); ++i) {
    std::string ids;
    for (const auto &id : vr.waves[i]) {
      if (!ids.empty()) {
        ids += ", ";
      }
      ids += id.str();
    }
    table.print_row({std::format("{}", i + 1), ids});
  }
  return 0;
}

} // namespace goalflow::cli
