#pragma once

#include "goalflow/reflection/evaluation.hpp"
#include "goalflow/util/enum.hpp"
#include "goalflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace goalflow {

enum class InsightCategory : std::uint8_t {
  ToolEffectiveness,
  FailureMode,
  Performance,
};
BOOST_DESCRIBE_ENUM(InsightCategory, ToolEffectiveness, FailureMode,
                    Performance)
GOALFLOW_DEFINE_ENUM_SERDE(InsightCategory, InsightCategory::ToolEffectiveness)

struct Insight {
  InsightCategory category{InsightCategory::ToolEffectiveness};
  // Capability name, failure category or task id the insight is about.
  std::string subject;
  std::string description;
  double confidence{0.0};
  std::size_t evidence{0};
  util::TimePoint created_at{};
};

struct PatternStats {
  PatternKind kind{PatternKind::RepeatedErrors};
  std::string key;
  std::size_t occurrences{0};
  util::TimePoint last_seen{};
};

// Accumulates what past episodes taught. Safe to share between threads.
class EpisodeLearner {
public:
  auto observe(const Evaluation &evaluation) -> void;

  // Returns the insights drawn from this episode; they are also stored.
  auto learn_from_episode(const Episode &episode) -> std::vector<Insight>;

  [[nodiscard]] auto
  insights(std::optional<InsightCategory> category = std::nullopt,
           double min_confidence = 0.0) const -> std::vector<Insight>;
  // Most frequent first.
  [[nodiscard]] auto failure_patterns() const -> std::vector<PatternStats>;
  [[nodiscard]] auto episodes_seen() const -> std::size_t;

  auto clear() -> void;

private:
  struct CapabilityStats {
    std::size_t succeeded{0};
    std::size_t total{0};
  };

  mutable std::mutex mu_;
  std::vector<Insight> insights_;
  std::map<std::string, PatternStats, std::less<>> patterns_;
  std::map<std::string, CapabilityStats, std::less<>> capabilities_;
  std::size_t episodes_{0};
};

} // namespace goalflow
