#pragma once

#include "tapbridge/observability/observer.hpp"

namespace tapbridge::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace tapbridge::observability
