#include "trustgate/observability/multi_observer.hpp"

namespace trustgate::observability {

void MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace trustgate::observability
