#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace goalflow {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  CycleDetected,
  DanglingDependency,
  SelfDependency,
  DuplicateTask,
  EmptyPlan,
  PlanUnavailable,
  StuckPlan,
  CapabilityNotFound,
  ExecutorShutdown,
  InvalidState,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 19> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "cycle detected in plan",
      "dependency references an unknown task",
      "task depends on itself",
      "duplicate task id",
      "plan has no tasks",
      "planner returned no tasks",
      "plan is stuck: no task can make progress",
      "capability not found",
      "executor is shut down",
      "invalid state transition",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "goalflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Structural errors abort a goal execution before or between waves.
[[nodiscard]] inline auto is_structural(std::error_code ec) noexcept -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::CycleDetected:
  case Error::DanglingDependency:
  case Error::SelfDependency:
  case Error::DuplicateTask:
  case Error::InvalidArgument:
  case Error::EmptyPlan:
    return true;
  default:
    return false;
  }
}

} // namespace goalflow

template <> struct std::is_error_code_enum<goalflow::Error> : std::true_type {};
