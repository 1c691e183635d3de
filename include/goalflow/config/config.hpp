#pragma once

#include "goalflow/config/engine_config.hpp"
#include "goalflow/core/error.hpp"

#include <string>
#include <string_view>

namespace goalflow {

// Reads EngineConfig from TOML. GOALFLOW_* environment variables override
// file values; the merged result is validated before it is returned.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto validate(const EngineConfig &config,
                                     std::string *diagnostic = nullptr)
      -> Result<void>;
};

// Points the process logger at the configured level and output.
[[nodiscard]] auto apply_logging(const LoggingConfig &config) -> Result<void>;

} // namespace goalflow
