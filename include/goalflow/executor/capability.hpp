#pragma once

#include "goalflow/core/error.hpp"
#include "goalflow/util/json.hpp"

#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace goalflow {

// Output of a capability call, or a human-readable error message.
using InvokeResult = std::expected<JsonValue, std::string>;

// Catalog of named capabilities the executor dispatches tasks to.
// Implementations must tolerate concurrent invoke() calls from worker threads.
// invoke() may also throw; the executor turns exceptions into failed results.
class ICapabilityInvoker {
public:
  virtual ~ICapabilityInvoker() = default;

  [[nodiscard]] virtual auto invoke(std::string_view capability,
                                    const JsonMap &params) -> InvokeResult = 0;
  [[nodiscard]] virtual auto has_capability(std::string_view capability) const
      -> bool = 0;
  [[nodiscard]] virtual auto capabilities() const
      -> std::vector<std::string> = 0;
};

// In-process catalog of handler functions. Populate it before handing it to an
// executor; lookups afterwards are read-only and therefore thread-safe.
class CapabilityRegistry final : public ICapabilityInvoker {
public:
  using Handler =
      std::move_only_function<InvokeResult(const JsonMap &params) const>;

  auto register_capability(std::string name, Handler handler) -> Result<void> {
    if (name.empty() || !handler) {
      return fail(Error::InvalidArgument);
    }
    if (handlers_.contains(name)) {
      return fail(Error::AlreadyExists);
    }
    handlers_.emplace(std::move(name), std::move(handler));
    return ok();
  }

  [[nodiscard]] auto invoke(std::string_view capability,
                            const JsonMap &params) -> InvokeResult override {
    auto it = handlers_.find(capability);
    if (it == handlers_.end()) {
      return std::unexpected(
          std::string("Capability not found: ").append(capability));
    }
    return it->second(params);
  }

  [[nodiscard]] auto has_capability(std::string_view capability) const
      -> bool override {
    return handlers_.find(capability) != handlers_.end();
  }

  [[nodiscard]] auto capabilities() const
      -> std::vector<std::string> override {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto &[name, _] : handlers_) {
      out.emplace_back(name);
    }
    return out;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return handlers_.size();
  }

private:
  std::map<std::string, Handler, std::less<>> handlers_;
};

} // namespace goalflow
