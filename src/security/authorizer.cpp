#include "trustgate/security/authorizer.hpp"

namespace trustgate::security {

CallbackAuthorizer::CallbackAuthorizer(Callback callback) : callback_(std::move(callback)) {}

std::optional<PermissionDecision> CallbackAuthorizer::authorize(const PermissionRequest &request) {
  if (!callback_) {
    return std::nullopt;
  }
  auto decision = callback_(request);
  if (decision.has_value() && !decision->allowed()) {
    // Normalise through deny() so a callback cannot produce a deny without a reason.
    return PermissionDecision::deny(decision->message);
  }
  return decision;
}

} // namespace trustgate::security
