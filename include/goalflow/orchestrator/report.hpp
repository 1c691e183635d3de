#pragma once

#include "goalflow/orchestrator/orchestrator.hpp"
#include "goalflow/reflection/evaluation.hpp"
#include "goalflow/util/json.hpp"

namespace goalflow {

[[nodiscard]] auto to_json(const Evaluation &evaluation) -> JsonValue;
[[nodiscard]] auto to_json(const GoalReport &report) -> JsonValue;

} // namespace goalflow
