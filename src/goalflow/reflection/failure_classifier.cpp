#include "goalflow/reflection/failure_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace goalflow {
namespace {

// Ordered: earlier categories take precedence over later ones.
constexpr std::array<std::pair<std::string_view, FailureCategory>, 25> kMarkers{{
    {"timeout", FailureCategory::Timeout},
    {"timed out", FailureCategory::Timeout},
    {"permission", FailureCategory::Permission},
    {"denied", FailureCategory::Permission},
    {"forbidden", FailureCategory::Permission},
    {"unauthorized", FailureCategory::Permission},
    {"not found", FailureCategory::NotFound},
    {"no such", FailureCategory::NotFound},
    {"does not exist", FailureCategory::NotFound},
    {"network", FailureCategory::Network},
    {"connection", FailureCategory::Network},
    {"unreachable", FailureCategory::Network},
    {"refused", FailureCategory::Network},
    {"dns", FailureCategory::Network},
    {"invalid", FailureCategory::Validation},
    {"validation", FailureCategory::Validation},
    {"malformed", FailureCategory::Validation},
    {"required parameter", FailureCategory::Validation},
    {"memory", FailureCategory::Resource},
    {"resource", FailureCategory::Resource},
    {"quota", FailureCategory::Resource},
    {"disk full", FailureCategory::Resource},
    {"no space", FailureCategory::Resource},
    {"rate limit", FailureCategory::Resource},
    {"too many requests", FailureCategory::Resource},
}};

[[nodiscard]] auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

} // namespace

auto classify_error(std::string_view message) -> FailureCategory {
  const auto text = to_lower(message);
  for (const auto &[marker, category] : kMarkers) {
    if (text.find(marker) != std::string::npos) {
      return category;
    }
  }
  return FailureCategory::Execution;
}

auto suggestion_for(FailureCategory category) -> std::string_view {
  switch (category) {
  case FailureCategory::Timeout:
    return "Increase the timeout or split the task into smaller steps";
  case FailureCategory::Permission:
    return "Check the credentials and access rights the capability needs";
  case FailureCategory::NotFound:
    return "Verify that the referenced resource exists or use another source";
  case FailureCategory::Network:
    return "Retry later or route through an alternative endpoint";
  case FailureCategory::Validation:
    return "Fix the task parameters before running it again";
  case FailureCategory::Resource:
    return "Reduce the workload or free up resources before retrying";
  case FailureCategory::Execution:
    return "Inspect the task logs and consider an alternative approach";
  }
  return "Inspect the task logs";
}

} // namespace goalflow
