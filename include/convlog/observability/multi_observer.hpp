#pragma once

#include "convlog/observability/observer.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace convlog::observability {

class MultiObserver final : public IObserver {
public:
  /// False when `observer` is null and nothing was added.
  bool add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace convlog::observability
