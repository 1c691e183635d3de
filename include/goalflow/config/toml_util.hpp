#pragma once

#include "goalflow/core/error.hpp"
#include "goalflow/util/log.hpp"

#include <glaze/toml.hpp>

#include <string>
#include <string_view>

namespace goalflow::toml_util {

/// Parse TOML text into a glaze-compatible struct T. Unknown keys are
/// tolerated so that one file can carry sections for other tools.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace goalflow::toml_util
