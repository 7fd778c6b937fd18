#pragma once

#include "codebox/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace codebox::observability {

enum class LogLevel { Debug, Info, Error };

/// Writes "[LEVEL] message" lines. Lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out, LogLevel min_level = LogLevel::Info);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

[[nodiscard]] LogLevel log_level_from_string(const std::string &value);

} // namespace codebox::observability
