#include "test_framework.hpp"

#include "codebox/observability/factory.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/observability/log_observer.hpp"
#include "codebox/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;
  namespace obs = codebox::observability;

  tests.push_back({"log_observer_formats_execution_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, obs::LogLevel::Info);
                     observer.record_event(obs::ExecutionStartEvent{
                         .code_digest = "abc123", .timeout_seconds = 30, .has_identity = true});
                     observer.record_event(obs::ExecutionEndEvent{
                         .outcome = "timeout",
                         .duration = std::chrono::milliseconds(1002),
                         .output_bytes = 12,
                         .truncated = false});
                     const std::string text = out.str();
                     require(text.find("[INFO] execution.start digest=abc123 timeout_s=30") !=
                                 std::string::npos,
                             "start line: " + text);
                     require(text.find("outcome=timeout duration_ms=1002") != std::string::npos,
                             "end line: " + text);
                   }});

  tests.push_back({"log_observer_respects_min_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, obs::LogLevel::Error);
                     observer.record_event(obs::LibraryProbeEvent{.library = "numpy",
                                                                  .status = "loaded"});
                     observer.record_event(obs::ValidationRejectedEvent{.code_digest = "d",
                                                                        .violation_count = 2});
                     observer.record_metric(obs::OutputBytesMetric{.bytes = 10});
                     require(out.str().empty(), "info and debug lines dropped");
                     observer.record_event(obs::ErrorEvent{.component = "executor",
                                                           .message = "boom"});
                     require(out.str() == "[ERROR] executor: boom\n", "error line: " + out.str());
                   }});

  tests.push_back({"failed_artifact_request_logs_as_error", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, obs::LogLevel::Error);
                     observer.record_event(obs::ArtifactRequestEvent{
                         .method = "GET", .path = "data.csv", .status = 404, .success = false});
                     require(out.str().find("artifact.get path=data.csv status=404") !=
                                 std::string::npos,
                             "artifact line: " + out.str());
                   }});

  tests.push_back({"log_level_parsing", [] {
                     require(obs::log_level_from_string("DEBUG") == obs::LogLevel::Debug, "debug");
                     require(obs::log_level_from_string("error") == obs::LogLevel::Error, "error");
                     require(obs::log_level_from_string("whatever") == obs::LogLevel::Info,
                             "fallback info");
                   }});

  tests.push_back({"factory_selects_backend", [] {
                     codebox::config::ObservabilityConfig config;
                     config.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty -> noop");
                     config.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.backend = "unknown";
                     require(obs::create_observer(config)->name() == "log", "unknown -> log");
                   }});

  tests.push_back({"factory_builds_backend_lists", [] {
                     codebox::config::ObservabilityConfig config;
                     config.backend = "log, noop";
                     require(obs::create_observer(config)->name() == "log+noop", "comma list");
                     config.backend = "log,log";
                     require(obs::create_observer(config)->name() == "log", "repeats collapse");
                     config.backend = "bogus, none";
                     require(obs::create_observer(config)->name() == "noop", "unknown skipped");
                     config.backend = "bogus, other";
                     require(obs::create_observer(config)->name() == "log", "nothing left -> log");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<codebox::testing::RecordingObserver>();
                     auto second = std::make_unique<codebox::testing::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers ignored");
                     require(multi.name() == "recording+recording", std::string(multi.name()));
                     multi.record_event(obs::ErrorEvent{.component = "c", .message = "m"});
                     multi.record_metric(obs::ExecutionLatencyMetric{});
                     require(first_ptr->events().size() == 1 && second_ptr->events().size() == 1,
                             "both received the event");
                     require(second_ptr->metric_count() == 1, "metric forwarded");
                   }});

  tests.push_back({"global_helpers_reach_installed_observer", [] {
                     codebox::testing::ObserverCapture capture;
                     obs::record_execution_start("d1", 5, false);
                     obs::record_validation_rejected("d1", 3);
                     obs::record_artifact_request("POST", "runs/r/results/a.csv", 201, true);
                     const auto events = capture.observer().events();
                     require(events.size() == 3, "three events recorded");
                     const auto *rejected = std::get_if<obs::ValidationRejectedEvent>(&events[1]);
                     require(rejected != nullptr && rejected->violation_count == 3,
                             "validation event");
                     const auto *request = std::get_if<obs::ArtifactRequestEvent>(&events[2]);
                     require(request != nullptr && request->status == 201 && request->success,
                             "artifact event");
                   }});

  tests.push_back({"global_helpers_without_observer_are_noops", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "nobody listening");
                     obs::record_library_probe("pandas", "loaded");
                   }});
}
