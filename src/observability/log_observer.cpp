#include "codebox/observability/log_observer.hpp"

#include "codebox/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace codebox::observability {

namespace {

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string bool_text(bool value) { return value ? "true" : "false"; }

} // namespace

LogLevel log_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver() : LogObserver(std::cerr) {}

LogObserver::LogObserver(std::ostream &out, LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExecutionStartEvent>) {
          log_line(LogLevel::Info, "execution.start digest=" + evt.code_digest +
                                       " timeout_s=" + std::to_string(evt.timeout_seconds) +
                                       " identity=" + bool_text(evt.has_identity));
        } else if constexpr (std::is_same_v<T, ValidationRejectedEvent>) {
          log_line(LogLevel::Info, "validation.rejected digest=" + evt.code_digest +
                                       " violations=" + std::to_string(evt.violation_count));
        } else if constexpr (std::is_same_v<T, ExecutionEndEvent>) {
          log_line(LogLevel::Info, "execution.end outcome=" + evt.outcome +
                                       " duration_ms=" + std::to_string(evt.duration.count()) +
                                       " output_bytes=" + std::to_string(evt.output_bytes) +
                                       " truncated=" + bool_text(evt.truncated));
        } else if constexpr (std::is_same_v<T, ArtifactRequestEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Error,
                   "artifact." + common::to_lower(evt.method) + " path=" + evt.path +
                       " status=" + std::to_string(evt.status));
        } else if constexpr (std::is_same_v<T, LibraryProbeEvent>) {
          log_line(LogLevel::Debug, "library.probe name=" + evt.library + " status=" + evt.status);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OutputBytesMetric>) {
          log_line(LogLevel::Debug, "metric.output_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace codebox::observability
