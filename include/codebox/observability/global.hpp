#pragma once

#include "codebox/observability/observer.hpp"

#include <memory>

namespace codebox::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_execution_start(const std::string &code_digest, std::uint32_t timeout_seconds,
                            bool has_identity);
void record_validation_rejected(const std::string &code_digest, std::size_t violation_count);
void record_execution_end(const std::string &outcome, std::chrono::milliseconds duration,
                          std::size_t output_bytes, bool truncated);
void record_artifact_request(const std::string &method, const std::string &path, long status,
                             bool success);
void record_library_probe(const std::string &library, const std::string &status);
void record_error(const std::string &component, const std::string &message);

} // namespace codebox::observability
