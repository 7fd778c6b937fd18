#include "test_framework.hpp"

#include "codebox/common/json_util.hpp"
#include "codebox/engine/executor.hpp"
#include "codebox/engine/result_format.hpp"
#include "codebox/sandbox/runtime.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>

namespace {

namespace engine = codebox::engine;

struct EngineFixture {
  std::shared_ptr<codebox::testing::FakeArtifactStore> store =
      std::make_shared<codebox::testing::FakeArtifactStore>();
  engine::Executor executor;

  explicit EngineFixture(codebox::config::Config config = codebox::testing::mock_config())
      : executor(std::move(config), store) {}

  engine::ExecutionResult run(const std::string &code,
                              std::optional<std::uint32_t> timeout = std::nullopt,
                              std::optional<std::string> session = std::nullopt,
                              std::optional<std::string> run_id = std::nullopt) {
    return executor.execute(engine::ExecutionRequest{.code = code,
                                                     .timeout_seconds = timeout,
                                                     .session_id = std::move(session),
                                                     .run_id = std::move(run_id)});
  }
};

std::string describe(const engine::ExecutionResult &result) {
  std::string text = engine::to_json(result);
  return text.size() > 600 ? text.substr(0, 600) : text;
}

bool has_violation(const engine::ExecutionResult &result, const std::string &needle) {
  if (!result.error.has_value()) {
    return false;
  }
  const auto &violations = result.error->violations;
  return std::any_of(violations.begin(), violations.end(), [&](const std::string &message) {
    return message.find(needle) != std::string::npos;
  });
}

bool is_kind(const engine::ExecutionResult &result, engine::ErrorKind kind) {
  return !result.ok && result.error.has_value() && result.error->kind == kind;
}

} // namespace

void register_engine_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;

  // ============================================
  // Pure helpers
  // ============================================

  tests.push_back({"format_output_appends_stderr_section", [] {
                     require(engine::format_output("out\n", "", 100).text == "out\n",
                             "stdout only");
                     const auto both = engine::format_output("out\n", "err\n", 100);
                     require(both.text == "out\n\n[stderr]:\nerr\n", both.text);
                     require(!both.truncated, "not truncated");
                   }});

  tests.push_back({"format_output_truncates_with_marker", [] {
                     const auto cut = engine::format_output(std::string(50, 'x'), "", 10);
                     require(cut.truncated, "truncated flag");
                     require(cut.text == std::string(10, 'x') +
                                             "\n... [output truncated, exceeds 10 bytes]",
                             cut.text);
                     const auto exact = engine::format_output(std::string(10, 'x'), "", 10);
                     require(!exact.truncated && exact.text.size() == 10, "exact fit kept");
                   }});

  tests.push_back({"format_output_never_splits_utf8", [] {
                     const auto cut = engine::format_output("a\xC3\xA9z", "", 2);
                     require(cut.text.rfind("a\n... [output truncated", 0) == 0,
                             "cut backs off to the lead byte: " + cut.text);
                   }});

  tests.push_back({"clamp_timeout_bounds", [] {
                     codebox::config::ExecutionConfig config;
                     config.default_timeout_seconds = 30;
                     config.max_timeout_seconds = 120;
                     require(engine::clamp_timeout(std::nullopt, config) == 30, "default");
                     require(engine::clamp_timeout(0U, config) == 1, "lower bound");
                     require(engine::clamp_timeout(5U, config) == 5, "passthrough");
                     require(engine::clamp_timeout(999U, config) == 120, "upper bound");
                   }});

  tests.push_back({"clean_traceback_keeps_guest_frames", [] {
                     const std::string raw = "Traceback (most recent call last):\n"
                                             "  File \"/usr/lib/python3.11/json/__init__.py\", "
                                             "line 346, in loads\n"
                                             "  File \"<user_code>\", line 2, in <module>\n"
                                             "    1 / 0\n"
                                             "ZeroDivisionError: division by zero";
                     const std::string cleaned = engine::clean_traceback(raw);
                     require(cleaned.find("json/__init__.py") == std::string::npos,
                             "host frame removed");
                     require(cleaned.find("<user_code>\", line 2") != std::string::npos,
                             "guest frame kept");
                     require(cleaned.find("ZeroDivisionError: division by zero") !=
                                 std::string::npos,
                             "exception line kept");
                   }});

  tests.push_back({"error_kinds_serialize", [] {
                     require(engine::error_kind_to_string(engine::ErrorKind::Validation) ==
                                 "validation_error",
                             "validation");
                     require(engine::error_kind_to_string(engine::ErrorKind::Import) ==
                                 "import_error",
                             "import");
                     require(engine::error_kind_to_string(engine::ErrorKind::Timeout) == "timeout",
                             "timeout");
                     require(engine::error_kind_to_string(engine::ErrorKind::Execution) ==
                                 "execution_error",
                             "execution");
                   }});

  tests.push_back({"result_json_shapes", [] {
                     engine::ExecutionResult ok;
                     ok.ok = true;
                     ok.output = "hi\n";
                     const std::string ok_json = engine::to_json(ok);
                     require(ok_json == R"({"ok":true,"output":"hi\n","result":null,"truncated":false})",
                             ok_json);

                     engine::ExecutionResult rejected;
                     rejected.error = engine::ErrorRecord{.kind = engine::ErrorKind::Validation,
                                                          .message = "Code validation failed",
                                                          .violations = {"a", "b"},
                                                          .exception_type = "",
                                                          .traceback = ""};
                     const std::string json = engine::to_json(rejected);
                     require(codebox::common::json_get_literal(json, "ok") == "false", json);
                     require(json.find("\"result\"") == std::string::npos, "no result on failure");
                     const auto error = codebox::common::json_get_object(json, "error");
                     require(codebox::common::json_get_string(error, "kind") == "validation_error",
                             error);
                     require(codebox::common::json_get_string_array(error, "messages").size() == 2,
                             "messages listed");
                   }});

  // ============================================
  // Executor
  // ============================================

  tests.push_back({"executor_runs_code_and_captures_stdout", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("for i in range(3):\n    print('line', i)\n");
                     require(result.ok, describe(result));
                     require(result.output == "line 0\nline 1\nline 2\n", result.output);
                     require(!result.result.has_value(), "no trailing expression");
                     require(!result.truncated, "not truncated");
                   }});

  tests.push_back({"executor_returns_trailing_expression", [] {
                     EngineFixture fixture;
                     const auto expr = fixture.run("x = 40\nx + 2");
                     require(expr.ok && expr.result == std::optional<std::string>("42"),
                             describe(expr));
                     const auto text = fixture.run("'caf\\u00e9'");
                     require(text.result == std::optional<std::string>("'caf\xC3\xA9'"),
                             describe(text));
                     const auto assign = fixture.run("x = 40\ny = x + 2");
                     require(assign.ok && !assign.result.has_value(), describe(assign));
                     const auto none = fixture.run("print('p')");
                     require(none.ok && !none.result.has_value(), "print returns None");
                   }});

  tests.push_back({"executor_evaluates_trailing_expression_once", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("calls = []\n"
                                                     "def bump():\n"
                                                     "    calls.append(1)\n"
                                                     "    print('bump')\n"
                                                     "    return len(calls)\n"
                                                     "bump()");
                     require(result.ok, describe(result));
                     require(result.result == std::optional<std::string>("1"), describe(result));
                     require(result.output == "bump\n", result.output);
                   }});

  tests.push_back({"executor_rejects_denied_import_before_running", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("print('SENTINEL')\nimport os\n");
                     require(is_kind(result, engine::ErrorKind::Validation), describe(result));
                     require(result.output.find("SENTINEL") == std::string::npos,
                             "code must not run");
                     require(has_violation(result, "Import blocked: 'os'"), describe(result));
                     require(result.error->message == "Code validation failed",
                             result.error->message);
                   }});

  tests.push_back({"executor_accepts_allowed_imports", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("import json\n"
                                                     "import math\n"
                                                     "from collections import Counter\n"
                                                     "json.dumps({'r': math.floor(2.7)})");
                     require(result.ok, describe(result));
                     require(result.result == std::optional<std::string>("'{\"r\": 2}'"),
                             describe(result));
                   }});

  tests.push_back({"executor_rejects_syntax_errors_with_one_message", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("def f(:\n  pass");
                     require(is_kind(result, engine::ErrorKind::Validation), describe(result));
                     require(result.error->violations.size() == 1, describe(result));
                     require(result.error->violations[0].rfind("Syntax error on line 1", 0) == 0,
                             result.error->violations[0]);
                   }});

  tests.push_back({"executor_rejects_bare_eval", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("eval('1 + 1')");
                     require(is_kind(result, engine::ErrorKind::Validation), describe(result));
                     require(has_violation(result, "Blocked function: 'eval()'"), describe(result));
                   }});

  tests.push_back({"executor_times_out_infinite_loop", [] {
                     EngineFixture fixture;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = fixture.run("print('before')\nwhile True:\n    pass\n", 1U);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(is_kind(result, engine::ErrorKind::Timeout), describe(result));
                     require(result.error->message == "Execution timed out after 1 seconds",
                             result.error->message);
                     require(result.output == "before\n", "partial output kept: " + result.output);
                     require(elapsed < std::chrono::seconds(4), "returned near the deadline");
                   }});

  tests.push_back({"executor_timeout_cannot_be_swallowed", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("while True:\n"
                                                     "    try:\n"
                                                     "        while True:\n"
                                                     "            pass\n"
                                                     "    except BaseException:\n"
                                                     "        print('caught')\n",
                                                     1U);
                     require(is_kind(result, engine::ErrorKind::Timeout), describe(result));
                   }});

  tests.push_back({"executor_runtime_usable_after_timeout", [] {
                     EngineFixture fixture;
                     const auto slow = fixture.run("while True:\n    pass\n", 1U);
                     require(is_kind(slow, engine::ErrorKind::Timeout), describe(slow));
                     const auto fast = fixture.run("sum(range(10))");
                     require(fast.ok && fast.result == std::optional<std::string>("45"),
                             describe(fast));
                   }});

  tests.push_back({"executor_blocking_sleep_stays_within_budget", [] {
                     EngineFixture fixture;
                     const auto started = std::chrono::steady_clock::now();
                     const auto direct = fixture.run("import time\ntime.sleep(8)\n", 1U);
                     require(is_kind(direct, engine::ErrorKind::Validation), describe(direct));
                     // An alias slips past the static check; the sealed view still hides sleep.
                     const auto aliased = fixture.run("import time\nt = time\nt.sleep(8)\n", 1U);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(is_kind(aliased, engine::ErrorKind::Execution), describe(aliased));
                     require(aliased.error->exception_type == "AttributeError", describe(aliased));
                     require(elapsed < std::chrono::seconds(4), "returned near the deadline");
                   }});

  tests.push_back({"executor_times_out_inside_result_repr", [] {
                     EngineFixture fixture;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = fixture.run("class A:\n"
                                                     "    def __repr__(self):\n"
                                                     "        while True:\n"
                                                     "            pass\n"
                                                     "A()",
                                                     1U);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(is_kind(result, engine::ErrorKind::Timeout), describe(result));
                     require(!result.result.has_value(), "no result after timeout");
                     require(elapsed < std::chrono::seconds(4), "returned near the deadline");
                   }});

  tests.push_back({"executor_rejects_writer_methods_with_paths", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("import numpy as np\n"
                                                     "np.arange(3).tofile('out.bin')\n");
                     require(is_kind(result, engine::ErrorKind::Validation), describe(result));
                     require(has_violation(result, "Blocked call: '.tofile()'"), describe(result));
                   }});

  tests.push_back({"executor_caps_output_at_limit", [] {
                     auto config = codebox::testing::mock_config();
                     config.execution.max_output_size = 100;
                     EngineFixture fixture(config);
                     const auto result = fixture.run("print('x' * 500)");
                     const std::string marker = "\n... [output truncated, exceeds 100 bytes]";
                     require(result.ok, describe(result));
                     require(result.truncated, "truncated flag");
                     require(result.output.size() == 100 + marker.size(),
                             "size " + std::to_string(result.output.size()));
                     require(result.output == std::string(100, 'x') + marker, result.output);
                   }});

  tests.push_back({"executor_keeps_no_state_between_calls", [] {
                     EngineFixture fixture;
                     const auto first = fixture.run("secret = 41");
                     require(first.ok, describe(first));
                     const auto second = fixture.run("secret + 1");
                     require(is_kind(second, engine::ErrorKind::Execution), describe(second));
                     require(second.error->exception_type == "NameError",
                             second.error->exception_type);
                   }});

  tests.push_back({"executor_reports_exceptions_with_guest_traceback", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("print('partial')\nvalue = 1 / 0\n");
                     require(is_kind(result, engine::ErrorKind::Execution), describe(result));
                     require(result.error->exception_type == "ZeroDivisionError",
                             result.error->exception_type);
                     require(result.error->message == "division by zero", result.error->message);
                     require(result.error->traceback.find("<user_code>\", line 2") !=
                                 std::string::npos,
                             result.error->traceback);
                     require(result.output == "partial\n", "partial output kept");
                     const std::string json = engine::to_json(result);
                     require(codebox::common::json_get_string(
                                 codebox::common::json_get_object(json, "error"), "type") ==
                                 "ZeroDivisionError",
                             json);
                   }});

  tests.push_back({"executor_guest_can_handle_ordinary_exceptions", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("try:\n"
                                                     "    {}['missing']\n"
                                                     "except KeyError as exc:\n"
                                                     "    caught = str(exc)\n"
                                                     "caught");
                     require(result.ok, describe(result));
                     require(result.result == std::optional<std::string>("\"'missing'\""),
                             describe(result));
                   }});

  tests.push_back({"executor_supports_classes", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("class Box:\n"
                                                     "    def __init__(self, v):\n"
                                                     "        self.v = v\n"
                                                     "    @property\n"
                                                     "    def double(self):\n"
                                                     "        return self.v * 2\n"
                                                     "Box(21).double");
                     require(result.ok && result.result == std::optional<std::string>("42"),
                             describe(result));
                   }});

  tests.push_back({"executor_runtime_import_of_denied_member_fails", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("from io import open\n");
                     require(is_kind(result, engine::ErrorKind::Execution), describe(result));
                     require(result.error->exception_type == "ImportError",
                             result.error->exception_type);
                   }});

  tests.push_back({"executor_sealed_modules_are_read_only", [] {
                     EngineFixture fixture;
                     const auto write = fixture.run("json.dumps = None");
                     require(is_kind(write, engine::ErrorKind::Execution), describe(write));
                     require(write.error->exception_type == "AttributeError",
                             write.error->exception_type);
                     const auto after = fixture.run("json.dumps([1])");
                     require(after.result == std::optional<std::string>("'[1]'"),
                             "shared module intact: " + describe(after));
                   }});

  tests.push_back({"executor_binds_helpers_only_with_session", [] {
                     EngineFixture fixture;
                     const auto anonymous = fixture.run("fetch_artifact");
                     require(is_kind(anonymous, engine::ErrorKind::Execution), describe(anonymous));
                     require(anonymous.error->exception_type == "NameError",
                             anonymous.error->exception_type);

                     fixture.store->put("s1", "data.json", R"({"n": 3})");
                     const auto scoped = fixture.run("fetch_artifact_json('data.json')['n'] * 2",
                                                     std::nullopt, std::string("s1"),
                                                     std::string("r1"));
                     require(scoped.ok && scoped.result == std::optional<std::string>("6"),
                             describe(scoped));
                     const auto identity = fixture.run("(_session_id, _run_id)", std::nullopt,
                                                       std::string("s1"), std::nullopt);
                     require(identity.result == std::optional<std::string>("('s1', None)"),
                             describe(identity));
                   }});

  tests.push_back({"executor_helper_errors_surface_as_execution_errors", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("upload_artifact('a.txt', 'x')", std::nullopt,
                                                     std::string("s1"), std::nullopt);
                     require(is_kind(result, engine::ErrorKind::Execution), describe(result));
                     require(result.error->exception_type == "RuntimeError",
                             result.error->exception_type);
                     require(result.error->message.find("No run_id available") !=
                                 std::string::npos,
                             result.error->message);
                   }});

  tests.push_back({"executor_records_lifecycle_events", [] {
                     EngineFixture fixture;
                     codebox::testing::ObserverCapture capture;
                     const auto ok = fixture.run("1");
                     const auto rejected = fixture.run("import socket");
                     require(ok.ok && !rejected.ok, "setup");
                     const auto events = capture.observer().events();
                     std::size_t starts = 0;
                     std::size_t rejections = 0;
                     std::vector<std::string> outcomes;
                     for (const auto &event : events) {
                       if (std::holds_alternative<codebox::observability::ExecutionStartEvent>(
                               event)) {
                         ++starts;
                       } else if (std::holds_alternative<
                                      codebox::observability::ValidationRejectedEvent>(event)) {
                         ++rejections;
                       } else if (const auto *end =
                                      std::get_if<codebox::observability::ExecutionEndEvent>(
                                          &event)) {
                         outcomes.push_back(end->outcome);
                       }
                     }
                     require(starts == 2, "two starts");
                     require(rejections == 1, "one rejection");
                     require(outcomes == std::vector<std::string>({"ok", "validation_error"}),
                             "end outcomes");
                     require(capture.observer().metric_count() == 4, "latency and bytes twice");
                   }});

  // ============================================
  // Result formatting with the data stack
  // ============================================

  tests.push_back({"result_format_classifies_core_values", [] {
                     codebox::testing::start_runtime();
                     pybind11::gil_scoped_acquire gil;
                     const auto &catalog = codebox::sandbox::Runtime::instance().catalog();
                     const pybind11::int_ number(7);
                     const pybind11::str text("hi");
                     pybind11::list list;
                     list.append(1);
                     list.append(2);
                     require(engine::classify_result(pybind11::none(), catalog) ==
                                 engine::ResultKind::None,
                             "none");
                     require(engine::classify_result(number, catalog) == engine::ResultKind::Scalar,
                             "scalar");
                     require(engine::classify_result(text, catalog) == engine::ResultKind::Text,
                             "text");
                     require(engine::classify_result(list, catalog) == engine::ResultKind::Other,
                             "other");
                     require(!engine::format_result(pybind11::none(), catalog).has_value(),
                             "none result");
                     require(engine::format_result(list, catalog) ==
                                 std::optional<std::string>("[1, 2]"),
                             "list repr");
                   }});

  tests.push_back({"result_format_caps_long_repr", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("'y' * 9000");
                     require(result.ok && result.result.has_value(), describe(result));
                     require(result.result->size() == 5000, std::to_string(result.result->size()));
                   }});

  tests.push_back({"result_format_falls_back_to_type_name", [] {
                     EngineFixture fixture;
                     const auto result = fixture.run("class Loud:\n"
                                                     "    def __repr__(self):\n"
                                                     "        raise ValueError('no')\n"
                                                     "Loud()");
                     require(result.ok, describe(result));
                     require(result.result == std::optional<std::string>("<class '__main__.Loud'>"),
                             describe(result));
                   }});

  tests.push_back({"result_format_describes_dataframes_and_arrays", [] {
                     codebox::testing::start_runtime();
                     const auto &catalog = codebox::sandbox::Runtime::instance().catalog();
                     EngineFixture fixture;
                     if (catalog.is_loaded("pandas")) {
                       const auto frame =
                           fixture.run("pd.DataFrame({'a': list(range(20)), 'b': [0] * 20})");
                       require(frame.ok, describe(frame));
                       require(frame.result->rfind("DataFrame(20 rows, 2 columns):\n", 0) == 0,
                               *frame.result);
                       const auto series = fixture.run("pd.Series([1, 2, 3])");
                       require(series.result->rfind("Series(3 items):\n", 0) == 0,
                               *series.result);
                     }
                     if (catalog.is_loaded("numpy")) {
                       const auto array = fixture.run("np.zeros((2, 3))");
                       require(array.ok, describe(array));
                       require(array.result->rfind("ndarray(shape=(2, 3)):\n", 0) == 0,
                               *array.result);
                     }
                   }});
}
