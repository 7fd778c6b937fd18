#pragma once

#include "codebox/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace codebox::observability {

/// Fans every event and metric out to its backends in insertion order.
/// name() joins the backend names with '+', e.g. "log+noop".
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_ = "multi";
};

} // namespace codebox::observability
