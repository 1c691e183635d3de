#pragma once

#include <chrono>
#include <format>
#include <string>

namespace goalflow::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Formats time point to ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

[[nodiscard]] inline auto to_seconds(std::chrono::nanoseconds d) -> double {
  return std::chrono::duration<double>(d).count();
}

} // namespace goalflow::util
