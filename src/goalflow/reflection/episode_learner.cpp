#include "goalflow/reflection/episode_learner.hpp"

#include "goalflow/reflection/failure_classifier.hpp"
#include "goalflow/util/log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace goalflow {
namespace {

[[nodiscard]] auto pattern_key(const FailurePattern &pattern) -> std::string {
  switch (pattern.kind) {
  case PatternKind::RepeatedErrors:
    return std::format("{}:{}", to_string_view(pattern.kind),
                       pattern.category ? to_string_view(*pattern.category)
                                        : std::string_view{"unknown"});
  case PatternKind::ToolFailure:
    return std::format("{}:{}", to_string_view(pattern.kind),
                       pattern.capability);
  case PatternKind::SequentialFailures:
    break;
  }
  return std::string(to_string_view(pattern.kind));
}

// Grows with the amount of evidence, saturating at ten observations.
[[nodiscard]] auto evidence_confidence(std::size_t samples) -> double {
  return std::min(1.0, 0.5 + 0.05 * static_cast<double>(samples));
}

[[nodiscard]] auto median(std::vector<double> values) -> double {
  std::ranges::sort(values);
  const auto n = values.size();
  if (n % 2 == 1) {
    return values[n / 2];
  }
  return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

} // namespace

auto EpisodeLearner::observe(const Evaluation &evaluation) -> void {
  if (evaluation.patterns.empty()) {
    return;
  }
  const auto now = util::Clock::now();
  std::lock_guard lock(mu_);
  for (const auto &pattern : evaluation.patterns) {
    auto key = pattern_key(pattern);
    auto [it, inserted] = patterns_.try_emplace(
        key, PatternStats{.kind = pattern.kind, .key = key});
    it->second.occurrences += pattern.occurrences;
    it->second.last_seen = now;
  }
}

auto EpisodeLearner::learn_from_episode(const Episode &episode)
    -> std::vector<Insight> {
  std::vector<Insight> learned;
  const auto now = util::Clock::now();

  std::map<std::string, CapabilityStats, std::less<>> episode_caps;
  std::map<FailureCategory, std::size_t> categories;
  std::size_t failures = 0;
  for (const auto &result : episode.results) {
    auto &stats = episode_caps[result.capability];
    ++stats.total;
    if (result.success) {
      ++stats.succeeded;
      continue;
    }
    ++failures;
    ++categories[result.timed_out() ? FailureCategory::Timeout
                                    : classify_error(result.error)];
  }

  std::lock_guard lock(mu_);
  ++episodes_;

  for (const auto &[capability, stats] : episode_caps) {
    if (capability.empty()) {
      continue;
    }
    auto &total = capabilities_[capability];
    total.succeeded += stats.succeeded;
    total.total += stats.total;
    const auto rate = static_cast<double>(total.succeeded) /
                      static_cast<double>(total.total);
    learned.push_back(Insight{
        .category = InsightCategory::ToolEffectiveness,
        .subject = capability,
        .description = std::format(
            "Capability '{}' succeeded {} of {} times ({:.0f}%)", capability,
            total.succeeded, total.total, rate * 100.0),
        .confidence = evidence_confidence(total.total),
        .evidence = total.total,
        .created_at = now});
  }

  if (failures > 0) {
    auto dominant = std::ranges::max_element(
        categories, [](const auto &a, const auto &b) {
          return a.second < b.second;
        });
    const auto share = static_cast<double>(dominant->second) /
                       static_cast<double>(failures);
    learned.push_back(Insight{
        .category = InsightCategory::FailureMode,
        .subject = std::string(to_string_view(dominant->first)),
        .description = std::format(
            "{} of {} failures were {} errors: {}", dominant->second, failures,
            to_string_view(dominant->first), suggestion_for(dominant->first)),
        .confidence = share,
        .evidence = dominant->second,
        .created_at = now});
  }

  if (episode.results.size() >= 3) {
    std::vector<double> durations;
    durations.reserve(episode.results.size());
    for (const auto &result : episode.results) {
      durations.push_back(result.duration_seconds());
    }
    const auto mid = median(durations);
    for (const auto &result : episode.results) {
      const auto took = result.duration_seconds();
      if (mid <= 0.0 || took <= 2.0 * mid) {
        continue;
      }
      learned.push_back(Insight{
          .category = InsightCategory::Performance,
          .subject = result.task_id.str(),
          .description = std::format(
              "Task {} ({}) took {:.3f}s, more than twice the median {:.3f}s",
              result.task_id, result.capability, took, mid),
          .confidence = 0.6,
          .evidence = 1,
          .created_at = now});
    }
  }

  insights_.insert(insights_.end(), learned.begin(), learned.end());
  log::debug("Episode {} yielded {} insights", episode.id, learned.size());
  return learned;
}

auto EpisodeLearner::insights(std::optional<InsightCategory> category,
                              double min_confidence) const
    -> std::vector<Insight> {
  std::lock_guard lock(mu_);
  std::vector<Insight> out;
  for (const auto &insight : insights_) {
    if (category && insight.category != *category) {
      continue;
    }
    if (insight.confidence < min_confidence) {
      continue;
    }
    out.push_back(insight);
  }
  return out;
}

auto EpisodeLearner::failure_patterns() const -> std::vector<PatternStats> {
  std::vector<PatternStats> out;
  {
    std::lock_guard lock(mu_);
    out.reserve(patterns_.size());
    for (const auto &[key, stats] : patterns_) {
      out.push_back(stats);
    }
  }
  std::ranges::stable_sort(out, [](const auto &a, const auto &b) {
    return a.occurrences > b.occurrences;
  });
  return out;
}

auto EpisodeLearner::episodes_seen() const -> std::size_t {
  std::lock_guard lock(mu_);
  return episodes_;
}

auto EpisodeLearner::clear() -> void {
  std::lock_guard lock(mu_);
  insights_.clear();
  patterns_.clear();
  capabilities_.clear();
  episodes_ = 0;
}

} // namespace goalflow
