#include "trustgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace trustgate::observability {

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (!verbose_ && level == "DEBUG") {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PermissionDecisionEvent>) {
          std::string line = "permission." + evt.behavior + " tool=" + evt.tool +
                             " source=" + evt.source;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(evt.behavior == "deny" ? "INFO" : "DEBUG", line);
        } else if constexpr (std::is_same_v<T, ConfirmationEvent>) {
          log_line("DEBUG", "confirmation." + evt.action + " tool=" + evt.tool +
                                " id=" + std::to_string(evt.item_id));
        } else if constexpr (std::is_same_v<T, RuleChangeEvent>) {
          log_line("INFO", "rule." + evt.action + " rule=" + evt.rule + " scope=" + evt.scope);
        } else if constexpr (std::is_same_v<T, ConfigReloadEvent>) {
          log_line("INFO", "config.reload path=" + evt.path);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.confirmation_queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ConfirmationLatencyMetric>) {
          log_line("DEBUG", "metric.confirmation_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace trustgate::observability
