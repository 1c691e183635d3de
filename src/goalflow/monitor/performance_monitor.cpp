#include "goalflow/monitor/performance_monitor.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace goalflow {

auto PerformanceMonitor::record_metric(const TaskId &task_id, std::string name,
                                       double value, std::string unit)
    -> void {
  std::lock_guard lock(mu_);
  samples_[task_id].emplace_back(PerformanceSample{.name = std::move(name),
                                                   .value = value,
                                                   .unit = std::move(unit),
                                                   .at = util::Clock::now()});
}

auto PerformanceMonitor::metrics(const TaskId &task_id) const
    -> std::vector<PerformanceSample> {
  std::lock_guard lock(mu_);
  auto it = samples_.find(task_id);
  if (it == samples_.end()) {
    return {};
  }
  return it->second;
}

auto PerformanceMonitor::summary(const TaskId &task_id,
                                 std::string_view name) const
    -> std::optional<MetricSummary> {
  std::lock_guard lock(mu_);
  auto it = samples_.find(task_id);
  if (it == samples_.end()) {
    return std::nullopt;
  }

  MetricSummary s{.min = std::numeric_limits<double>::max(),
                  .max = std::numeric_limits<double>::lowest(),
                  .avg = 0.0,
                  .count = 0};
  double sum = 0.0;
  for (const auto &sample : it->second) {
    if (sample.name != name) {
      continue;
    }
    s.min = std::min(s.min, sample.value);
    s.max = std::max(s.max, sample.value);
    sum += sample.value;
    ++s.count;
  }
  if (s.count == 0) {
    return std::nullopt;
  }
  s.avg = sum / static_cast<double>(s.count);
  return s;
}

auto PerformanceMonitor::clear(const TaskId &task_id) -> void {
  std::lock_guard lock(mu_);
  samples_.erase(task_id);
}

auto PerformanceMonitor::clear_all() -> void {
  std::lock_guard lock(mu_);
  samples_.clear();
}

} // namespace goalflow
