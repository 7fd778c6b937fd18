#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace codebox::observability {

struct ExecutionStartEvent {
  std::string code_digest;
  std::uint32_t timeout_seconds = 0;
  bool has_identity = false;
};

struct ValidationRejectedEvent {
  std::string code_digest;
  std::size_t violation_count = 0;
};

struct ExecutionEndEvent {
  std::string outcome;
  std::chrono::milliseconds duration{0};
  std::size_t output_bytes = 0;
  bool truncated = false;
};

struct ArtifactRequestEvent {
  std::string method;
  std::string path;
  long status = 0;
  bool success = false;
};

struct LibraryProbeEvent {
  std::string library;
  std::string status;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ExecutionStartEvent, ValidationRejectedEvent, ExecutionEndEvent,
                 ArtifactRequestEvent, LibraryProbeEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct OutputBytesMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, OutputBytesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Selected by the "none" backend; drops everything.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace codebox::observability
