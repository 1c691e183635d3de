#pragma once

#include "goalflow/core/constants.hpp"
#include "goalflow/executor/task_executor.hpp"
#include "goalflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>

namespace goalflow {

// Autonomy gate. Paranoid stops after planning and hands the plan back for
// approval; Balanced and Autonomous currently behave the same.
enum class TrustLevel : std::uint8_t {
  Paranoid,
  Balanced,
  Autonomous,
};
BOOST_DESCRIBE_ENUM(TrustLevel, Paranoid, Balanced, Autonomous)
GOALFLOW_DEFINE_ENUM_SERDE(TrustLevel, TrustLevel::Balanced)

[[nodiscard]] constexpr auto requires_approval(TrustLevel level) noexcept
    -> bool {
  return level == TrustLevel::Paranoid;
}

struct OrchestratorOptions {
  TrustLevel trust_level{TrustLevel::Balanced};
  std::size_t max_concurrent_tasks{orchestrator_defaults::kMaxConcurrentTasks};
  int max_replanning_attempts{orchestrator_defaults::kMaxReplanningAttempts};
  RetryPolicy retry{};
  bool enable_reflection{true};
};

} // namespace goalflow
