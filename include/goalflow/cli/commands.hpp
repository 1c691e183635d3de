#pragma once

#include <optional>
#include <string>

namespace goalflow::cli {

struct ValidateOptions {
  std::string plan_file;
  bool json{false};
};

struct SimulateOptions {
  std::string plan_file;
  std::string config_file;
  // Task list handed back on the first revision request; without it the
  // planner keeps the current plan.
  std::optional<std::string> revision_file;
  std::optional<std::string> trust_level;
  std::optional<std::string> log_level;
  bool json{false};
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_simulate(const SimulateOptions &opts) -> int;

} // namespace goalflow::cli
