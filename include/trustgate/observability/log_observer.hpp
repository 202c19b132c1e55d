#pragma once

#include "trustgate/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace trustgate::observability {

/// Writes one `[LEVEL] message` line per event. Debug-level lines are dropped unless verbose.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  LogObserver(std::ostream &out, bool verbose);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
  std::mutex mutex_;
};

} // namespace trustgate::observability
