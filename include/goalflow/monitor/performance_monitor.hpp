#pragma once

#include "goalflow/util/id.hpp"
#include "goalflow/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace goalflow {

struct PerformanceSample {
  std::string name;
  double value{0.0};
  std::string unit;
  util::TimePoint at{};
};

struct MetricSummary {
  double min{0.0};
  double max{0.0};
  double avg{0.0};
  std::size_t count{0};
};

class PerformanceMonitor {
public:
  auto record_metric(const TaskId &task_id, std::string name, double value,
                     std::string unit = {}) -> void;

  [[nodiscard]] auto metrics(const TaskId &task_id) const
      -> std::vector<PerformanceSample>;
  // nullopt when the task never recorded `name`.
  [[nodiscard]] auto summary(const TaskId &task_id,
                             std::string_view name) const
      -> std::optional<MetricSummary>;

  auto clear(const TaskId &task_id) -> void;
  auto clear_all() -> void;

private:
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<TaskId, std::vector<PerformanceSample>> samples_;
};

} // namespace goalflow
