#pragma once

#include "goalflow/reflection/evaluation.hpp"

#include <string_view>

namespace goalflow {

// Case-insensitive keyword match over the error text. Categories are tried
// in declaration order and the first hit wins; no hit means Execution.
[[nodiscard]] auto classify_error(std::string_view message) -> FailureCategory;

// True for failures a different plan might avoid: timeout, not_found,
// network and resource.
[[nodiscard]] constexpr auto should_replan_for(FailureCategory category) noexcept
    -> bool {
  switch (category) {
  case FailureCategory::Timeout:
  case FailureCategory::NotFound:
  case FailureCategory::Network:
  case FailureCategory::Resource:
    return true;
  case FailureCategory::Permission:
  case FailureCategory::Validation:
  case FailureCategory::Execution:
    return false;
  }
  return false;
}

[[nodiscard]] auto suggestion_for(FailureCategory category) -> std::string_view;

} // namespace goalflow
