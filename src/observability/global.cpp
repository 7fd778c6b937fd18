#include "codebox/observability/global.hpp"

#include <mutex>

namespace codebox::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_execution_start(const std::string &code_digest, const std::uint32_t timeout_seconds,
                            const bool has_identity) {
  record_event(ExecutionStartEvent{.code_digest = code_digest,
                                   .timeout_seconds = timeout_seconds,
                                   .has_identity = has_identity});
}

void record_validation_rejected(const std::string &code_digest,
                                const std::size_t violation_count) {
  record_event(
      ValidationRejectedEvent{.code_digest = code_digest, .violation_count = violation_count});
}

void record_execution_end(const std::string &outcome, std::chrono::milliseconds duration,
                          const std::size_t output_bytes, const bool truncated) {
  record_event(ExecutionEndEvent{.outcome = outcome,
                                 .duration = duration,
                                 .output_bytes = output_bytes,
                                 .truncated = truncated});
  record_metric(ExecutionLatencyMetric{.latency = duration});
  record_metric(OutputBytesMetric{.bytes = output_bytes});
}

void record_artifact_request(const std::string &method, const std::string &path,
                             const long status, const bool success) {
  record_event(
      ArtifactRequestEvent{.method = method, .path = path, .status = status, .success = success});
}

void record_library_probe(const std::string &library, const std::string &status) {
  record_event(LibraryProbeEvent{.library = library, .status = status});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace codebox::observability
