#pragma once

#include "goalflow/executor/task_executor.hpp"
#include "goalflow/orchestrator/options.hpp"
#include "goalflow/reflection/evaluator.hpp"

#include <string>

namespace goalflow {

struct LoggingConfig {
  std::string level{"info"};
  // Empty means stderr.
  std::string file;
};

struct EngineConfig {
  ExecutorOptions executor{};
  OrchestratorOptions orchestrator{};
  ReflectionCriteria reflection{};
  LoggingConfig logging{};
};

} // namespace goalflow
