#pragma once

#include <chrono>
#include <cstddef>

namespace goalflow {

namespace executor_defaults {
inline constexpr std::size_t kMaxWorkers = 4;
inline constexpr auto kTaskTimeout = std::chrono::seconds(300);
inline constexpr std::size_t kMaxMemoryMb = 1024;
inline constexpr double kMaxCpuPercent = 80.0;
} // namespace executor_defaults

namespace orchestrator_defaults {
inline constexpr std::size_t kMaxConcurrentTasks = 4;
inline constexpr int kMaxReplanningAttempts = 3;
inline constexpr int kMaxRetries = 0;
inline constexpr auto kRetryDelay = std::chrono::milliseconds(1000);
} // namespace orchestrator_defaults

namespace reflection_defaults {
inline constexpr double kMinSuccessRate = 0.8;
inline constexpr double kMaxExecutionTimeMultiplier = 2.0;
inline constexpr double kTaskSuccessConfidence = 0.9;
inline constexpr double kSlowTaskConfidence = 0.7;
inline constexpr double kTaskFailureConfidence = 0.3;
// A dependency chain this long that spans (almost) the whole plan is flagged.
inline constexpr std::size_t kLongChainDepth = 5;
inline constexpr double kLongChainRatio = 0.8;
} // namespace reflection_defaults

namespace timing {
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(5);
} // namespace timing

} // namespace goalflow
