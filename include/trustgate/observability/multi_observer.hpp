#pragma once

#include "trustgate/observability/observer.hpp"

#include <memory>
#include <vector>

namespace trustgate::observability {

class MultiObserver final : public IObserver {
public:
  void add(std::shared_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::shared_ptr<IObserver>> observers_;
};

} // namespace trustgate::observability
