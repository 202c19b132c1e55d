#pragma once

#include "trustgate/observability/observer.hpp"

#include <memory>

namespace trustgate::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_permission_decision(const std::string &tool, const std::string &behavior,
                                const std::string &source, const std::string &detail = "");
void record_confirmation(const std::string &tool, const std::string &action,
                         std::uint64_t item_id);
void record_rule_change(const std::string &action, const std::string &rule,
                        const std::string &scope);
void record_config_reload(const std::string &path);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace trustgate::observability
