#pragma once

#include "goalflow/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace goalflow {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

// Ordered so that dumps and comparisons are deterministic.
using JsonMap = std::map<std::string, JsonValue, std::less<>>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto to_json(const JsonMap &map) -> JsonValue {
  JsonValue obj = JsonValue::object_t{};
  for (const auto &[key, value] : map) {
    obj.get_object().emplace(key, value);
  }
  return obj;
}

[[nodiscard]] inline auto from_json_object(const JsonValue &value) -> JsonMap {
  JsonMap out;
  if (!value.is_object()) {
    return out;
  }
  for (const auto &[key, item] : value.get_object()) {
    out.emplace(key, item);
  }
  return out;
}

// Null, empty string, empty array and empty object all count as no output.
[[nodiscard]] inline auto is_empty_json(const JsonValue &value) -> bool {
  if (value.is_null()) {
    return true;
  }
  if (value.is_string()) {
    return value.get<std::string>().empty();
  }
  if (value.is_array()) {
    return value.get_array().empty();
  }
  if (value.is_object()) {
    return value.get_object().empty();
  }
  return false;
}

[[nodiscard]] inline auto json_number(const JsonValue &value)
    -> std::optional<double> {
  if (value.is_number()) {
    return value.as<double>();
  }
  return std::nullopt;
}

[[nodiscard]] inline auto json_bool(const JsonMap &map, std::string_view key)
    -> bool {
  auto it = map.find(key);
  return it != map.end() && it->second.is_boolean() &&
         it->second.get<bool>();
}

[[nodiscard]] inline auto json_int(const JsonMap &map, std::string_view key,
                                   std::int64_t fallback = 0) -> std::int64_t {
  auto it = map.find(key);
  if (it == map.end() || !it->second.is_number()) {
    return fallback;
  }
  return it->second.as<std::int64_t>();
}

} // namespace goalflow
