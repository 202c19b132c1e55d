#include "trustgate/observability/factory.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/observability/log_observer.hpp"
#include "trustgate/observability/multi_observer.hpp"
#include "trustgate/observability/noop_observer.hpp"

#include <sstream>

namespace trustgate::observability {

namespace {

std::shared_ptr<IObserver> create_single(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_shared<NoopObserver>();
  }
  if (name == "log-verbose" || name == "debug") {
    return std::make_shared<LogObserver>(true);
  }
  return std::make_shared<LogObserver>(false);
}

} // namespace

std::shared_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.find(',') == std::string::npos) {
    return create_single(normalized);
  }

  auto multi = std::make_shared<MultiObserver>();
  std::stringstream stream(normalized);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(create_single(name));
    }
  }
  return multi;
}

} // namespace trustgate::observability
