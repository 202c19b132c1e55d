#pragma once

#include "trustgate/security/permission_types.hpp"

#include <functional>
#include <optional>
#include <string_view>

namespace trustgate::security {

/// Embedding-application hook consulted before the permission mode. Returning nullopt
/// abstains and lets evaluation continue; implementations may throw.
class IAuthorizer {
public:
  virtual ~IAuthorizer() = default;

  [[nodiscard]] virtual std::optional<PermissionDecision>
  authorize(const PermissionRequest &request) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopAuthorizer final : public IAuthorizer {
public:
  [[nodiscard]] std::optional<PermissionDecision>
  authorize(const PermissionRequest &) override {
    return std::nullopt;
  }
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

class CallbackAuthorizer final : public IAuthorizer {
public:
  using Callback = std::function<std::optional<PermissionDecision>(const PermissionRequest &)>;

  explicit CallbackAuthorizer(Callback callback);

  [[nodiscard]] std::optional<PermissionDecision>
  authorize(const PermissionRequest &request) override;
  [[nodiscard]] std::string_view name() const override { return "callback"; }

private:
  Callback callback_;
};

} // namespace trustgate::security
