#pragma once

#include "goalflow/core/error.hpp"
#include "goalflow/plan/plan_types.hpp"
#include "goalflow/util/json.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace goalflow {

// On-disk / planner-facing form of a plan:
//   {"goal": "...", "tasks": [{"id", "description", "capability", "params",
//                              "dependencies", "metadata"}, ...]}
struct PlanDocument {
  std::string goal;
  std::vector<Task> tasks;
};

class PlanCodec {
public:
  [[nodiscard]] static auto parse(std::string_view json_text,
                                  std::string *diagnostic = nullptr)
      -> Result<PlanDocument>;
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<PlanDocument>;

  [[nodiscard]] static auto to_json(const Task &task) -> JsonValue;
  [[nodiscard]] static auto to_json(const Plan &plan) -> JsonValue;
  [[nodiscard]] static auto to_json(const TaskResult &result) -> JsonValue;
  [[nodiscard]] static auto to_json(const Goal &goal) -> JsonValue;
};

} // namespace goalflow
