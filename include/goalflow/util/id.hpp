#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace goalflow {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

// Phantom type tags for type-safe ID disambiguation
struct GoalTag {};
struct PlanTag {};
struct TaskTag {};
struct EpisodeTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using GoalId = TypedId<GoalTag>;
using PlanId = TypedId<PlanTag>;
using TaskId = TypedId<TaskTag>;
using EpisodeId = TypedId<EpisodeTag>;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace goalflow

// `is_avalanching` makes ankerl::unordered_dense::hash delegate to std::hash
// instead of hashing the raw bytes of the std::string member.
template <typename Tag> struct std::hash<goalflow::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const goalflow::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<goalflow::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const goalflow::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace goalflow {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_goal_id() -> GoalId {
  return GoalId{std::format("goal_{}", detail::generate_uuid_v7_like())};
}

[[nodiscard]] inline auto generate_plan_id() -> PlanId {
  return PlanId{std::format("plan_{}", detail::generate_uuid_v7_like())};
}

[[nodiscard]] inline auto generate_episode_id() -> EpisodeId {
  return EpisodeId{std::format("ep_{}", detail::generate_uuid_v7_like())};
}

} // namespace goalflow
