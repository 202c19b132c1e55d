#include "trustgate/observability/global.hpp"

#include <mutex>

namespace trustgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_permission_decision(const std::string &tool, const std::string &behavior,
                                const std::string &source, const std::string &detail) {
  record_event(PermissionDecisionEvent{
      .tool = tool, .behavior = behavior, .source = source, .detail = detail});
}

void record_confirmation(const std::string &tool, const std::string &action,
                         const std::uint64_t item_id) {
  record_event(ConfirmationEvent{.tool = tool, .action = action, .item_id = item_id});
}

void record_rule_change(const std::string &action, const std::string &rule,
                        const std::string &scope) {
  record_event(RuleChangeEvent{.action = action, .rule = rule, .scope = scope});
}

void record_config_reload(const std::string &path) { record_event(ConfigReloadEvent{.path = path}); }

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace trustgate::observability
