#pragma once

#include "goalflow/core/error.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace goalflow::util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

} // namespace goalflow::util
