#pragma once

#include "trustgate/observability/observer.hpp"

#include <memory>
#include <string>

namespace trustgate::observability {

/// Backend names: "log", "log-verbose", "none"/"noop", or a comma separated list of them.
/// Unknown names fall back to "log".
[[nodiscard]] std::shared_ptr<IObserver> create_observer(const std::string &backend);

} // namespace trustgate::observability
