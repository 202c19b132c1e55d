#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace trustgate::observability {

struct PermissionDecisionEvent {
  std::string tool;
  std::string behavior;
  /// Which evaluation step produced the decision, e.g. "deny-rule", "mode", "user".
  std::string source;
  std::string detail;
};

struct ConfirmationEvent {
  std::string tool;
  std::string action; // enqueued | allowed | denied | cancelled
  std::uint64_t item_id = 0;
};

struct RuleChangeEvent {
  std::string action; // persisted | removed | temporary-added | temporary-cleared
  std::string rule;
  std::string scope;
};

struct ConfigReloadEvent {
  std::string path;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<PermissionDecisionEvent, ConfirmationEvent, RuleChangeEvent,
                                   ConfigReloadEvent, WarningEvent, ErrorEvent>;

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct ConfirmationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<QueueDepthMetric, ConfirmationLatencyMetric>;

/// Implementations must not throw. Events are recorded from destructors such as
/// the temporary-rule scope's, where an escaping exception terminates the process.
class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace trustgate::observability
