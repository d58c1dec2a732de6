#pragma once

#include "pairlink/observability/observer.hpp"

#include <mutex>

namespace pairlink::observability {

/// Writes one `[LEVEL] message` line per event to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex write_mutex_;
};

} // namespace pairlink::observability
