#include "codebox/engine/executor.hpp"

#include "codebox/artifacts/helpers.hpp"
#include "codebox/common/fs.hpp"
#include "codebox/common/json_util.hpp"
#include "codebox/engine/result_format.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/sandbox/cancellation.hpp"
#include "codebox/sandbox/namespace.hpp"
#include "codebox/sandbox/output_capture.hpp"
#include "codebox/sandbox/runtime.hpp"
#include "codebox/security/validator.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace codebox::engine {

namespace {

constexpr const char *kSourceName = "<user_code>";

ExecutionResult failure(ErrorKind kind, std::string message) {
  ExecutionResult result;
  result.ok = false;
  result.error = ErrorRecord{.kind = kind,
                             .message = std::move(message),
                             .violations = {},
                             .exception_type = "",
                             .traceback = ""};
  return result;
}

std::string outcome_name(const ExecutionResult &result) {
  if (result.ok || !result.error.has_value()) {
    return "ok";
  }
  return error_kind_to_string(result.error->kind);
}

/// Compiled guest program: the statements, and the trailing bare expression
/// compiled separately when there is one.
struct CompiledProgram {
  py::object body;
  py::object tail;
};

common::Result<CompiledProgram> compile_program(const std::string &code) {
  try {
    const auto ast = py::module_::import("ast");
    const auto compile = py::module_::import("builtins").attr("compile");
    const py::object tree = ast.attr("parse")(code, kSourceName);
    py::list statements = tree.attr("body");

    CompiledProgram program;
    if (!statements.empty()) {
      const py::object last = statements[statements.size() - 1];
      if (py::isinstance(last, ast.attr("Expr"))) {
        program.tail = compile(ast.attr("Expression")(last.attr("value")), kSourceName, "eval");
        statements.attr("pop")();
      }
    }
    program.body = compile(tree, kSourceName, "exec");
    return common::Result<CompiledProgram>::success(std::move(program));
  } catch (const py::error_already_set &error) {
    return common::Result<CompiledProgram>::failure(sandbox::describe(error));
  }
}

std::string format_traceback(const py::error_already_set &error) {
  try {
    const py::object trace =
        error.trace() ? py::reinterpret_borrow<py::object>(error.trace()) : py::none();
    const py::object lines = py::module_::import("traceback")
                                 .attr("format_exception")(error.type(), error.value(), trace);
    return sandbox::utf8(py::str("").attr("join")(lines));
  } catch (const py::error_already_set &failure) {
    return "traceback unavailable: " + sandbox::describe(failure);
  }
}

std::string render_violations(const std::vector<std::string> &violations) {
  std::string out = "[";
  for (std::size_t i = 0; i < violations.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += common::json_quote(violations[i]);
  }
  out += "]";
  return out;
}

} // namespace

std::string error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation_error";
  case ErrorKind::Import:
    return "import_error";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Execution:
    return "execution_error";
  }
  return "execution_error";
}

std::string to_json(const ExecutionResult &result) {
  std::ostringstream out;
  out << "{\"ok\":" << (result.ok ? "true" : "false");
  out << ",\"output\":" << common::json_quote(result.output);
  if (result.ok) {
    out << ",\"result\":" << (result.result.has_value() ? common::json_quote(*result.result) : "null");
  }
  if (result.error.has_value()) {
    const ErrorRecord &error = *result.error;
    out << ",\"error\":{\"kind\":" << common::json_quote(error_kind_to_string(error.kind));
    out << ",\"message\":" << common::json_quote(error.message);
    if (error.kind == ErrorKind::Validation) {
      out << ",\"messages\":" << render_violations(error.violations);
    }
    if (error.kind == ErrorKind::Execution) {
      out << ",\"type\":" << common::json_quote(error.exception_type);
      out << ",\"traceback\":" << common::json_quote(error.traceback);
    }
    out << "}";
  }
  out << ",\"truncated\":" << (result.truncated ? "true" : "false") << "}";
  return out.str();
}

FormattedOutput format_output(const std::string &stdout_text, const std::string &stderr_text,
                              const std::size_t max_bytes) {
  FormattedOutput formatted;
  formatted.text = stdout_text;
  if (!stderr_text.empty()) {
    formatted.text += "\n[stderr]:\n" + stderr_text;
  }
  if (formatted.text.size() <= max_bytes) {
    return formatted;
  }

  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(formatted.text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  formatted.text.resize(cut);
  formatted.text +=
      "\n... [output truncated, exceeds " + std::to_string(max_bytes) + " bytes]";
  formatted.truncated = true;
  return formatted;
}

std::uint32_t clamp_timeout(const std::optional<std::uint32_t> requested,
                            const config::ExecutionConfig &config) {
  const std::uint32_t upper = std::max<std::uint32_t>(1, config.max_timeout_seconds);
  const std::uint32_t value = requested.value_or(config.default_timeout_seconds);
  return std::clamp<std::uint32_t>(value, 1, upper);
}

std::string clean_traceback(const std::string &traceback) {
  std::istringstream stream(traceback);
  std::string line;
  std::string out;
  bool first = true;
  while (std::getline(stream, line)) {
    if (line.find(kSourceName) == std::string::npos &&
        common::starts_with(common::trim(line), "File")) {
      continue;
    }
    if (!first) {
      out += "\n";
    }
    out += line;
    first = false;
  }
  return out;
}

Executor::Executor(config::Config config, std::shared_ptr<artifacts::IArtifactStore> store,
                   const security::PolicySet &policy)
    : config_(std::move(config)), store_(std::move(store)), policy_(policy) {}

ExecutionResult Executor::execute(const ExecutionRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  const std::string digest = common::sha256_hex(request.code).substr(0, 12);
  const std::uint32_t timeout_seconds = clamp_timeout(request.timeout_seconds, config_.execution);
  observability::record_execution_start(digest, timeout_seconds, request.session_id.has_value());

  ExecutionResult result;
  try {
    auto &runtime = sandbox::Runtime::instance();
    const auto status = runtime.start();
    if (!status.ok()) {
      result = failure(ErrorKind::Import, "Python runtime unavailable: " + status.error());
    } else {
      std::lock_guard<std::mutex> gate(runtime.execution_gate());
      py::gil_scoped_acquire gil;
      result = run_locked(request, timeout_seconds, digest);
    }
  } catch (const std::exception &ex) {
    observability::record_error("executor", ex.what());
    result = failure(ErrorKind::Execution, std::string("internal error: ") + ex.what());
    result.error->exception_type = "InternalError";
  }

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_execution_end(outcome_name(result), duration, result.output.size(),
                                      result.truncated);
  return result;
}

ExecutionResult Executor::run_locked(const ExecutionRequest &request,
                                     const std::uint32_t timeout_seconds,
                                     const std::string &digest) {
  auto &runtime = sandbox::Runtime::instance();
  const auto &catalog = runtime.catalog();

  const security::CodeValidator validator(policy_);
  auto outcome = validator.validate(request.code);
  if (!outcome.is_valid) {
    observability::record_validation_rejected(digest, outcome.violations.size());
    ExecutionResult rejected = failure(ErrorKind::Validation, "Code validation failed");
    rejected.error->violations = std::move(outcome.violations);
    return rejected;
  }

  if (const auto hard_failure = catalog.hard_failure()) {
    return failure(ErrorKind::Import, *hard_failure);
  }

  auto globals_result = sandbox::NamespaceBuilder(catalog, policy_).build();
  if (!globals_result.ok()) {
    return failure(ErrorKind::Import, "Failed to prepare namespace: " + globals_result.error());
  }
  py::dict globals = globals_result.take();

  const auto budget = std::chrono::seconds(timeout_seconds);
  const auto deadline = std::chrono::steady_clock::now() + budget;
  if (request.session_id.has_value()) {
    auto context = std::make_shared<artifacts::HelperContext>();
    context->session_id = *request.session_id;
    context->run_id = request.run_id;
    context->store = store_;
    context->deadline = deadline;
    context->fetch_timeout = std::chrono::seconds(config_.artifact_store.fetch_timeout_seconds);
    context->upload_timeout = std::chrono::seconds(config_.artifact_store.upload_timeout_seconds);
    context->pandas_available = catalog.is_loaded("pandas");
    const auto bound = artifacts::bind_helpers(globals, context);
    if (!bound.ok()) {
      globals.clear();
      return failure(ErrorKind::Import, "Failed to bind artifact helpers: " + bound.error());
    }
  }

  auto program = compile_program(request.code);
  if (!program.ok()) {
    globals.clear();
    ExecutionResult failed = failure(ErrorKind::Execution, program.error());
    failed.error->exception_type = "SyntaxError";
    return failed;
  }
  const CompiledProgram &compiled = program.value();
  const auto builtins = py::module_::import("builtins");

  ExecutionResult result;
  sandbox::CancellationToken token;
  bool timed_out = false;
  {
    sandbox::CaptureScope capture(config_.execution.max_output_size);
    if (!capture.active()) {
      globals.clear();
      return failure(ErrorKind::Import, "Failed to capture output: " + capture.error());
    }

    {
      sandbox::Watchdog watchdog(token, std::chrono::duration_cast<std::chrono::milliseconds>(budget));
      sandbox::TraceGuard trace(token, runtime.timeout_error());

      try {
        builtins.attr("exec")(compiled.body, globals);
        if (compiled.tail) {
          const py::object value = builtins.attr("eval")(compiled.tail, globals);
          result.result = format_result(value, catalog);
        }
      } catch (const py::error_already_set &error) {
        timed_out = token.is_cancelled() || error.matches(runtime.timeout_error());
        if (!timed_out) {
          // Still under the trace so a guest __str__ cannot hang the host.
          const auto message = sandbox::str_of(error.value());
          result.error = ErrorRecord{.kind = ErrorKind::Execution,
                                     .message = message.ok() ? message.value()
                                                             : "<exception str() failed>",
                                     .violations = {},
                                     .exception_type = sandbox::type_name(error.value()),
                                     .traceback = clean_traceback(format_traceback(error))};
        }
      }
      trace.remove();
      // A budget spent inside result formatting (a looping __repr__) surfaces
      // only as the type-name fallback, so the token decides.
      timed_out = timed_out || token.is_cancelled();
      watchdog.disarm();
    }

    capture.restore();
    const auto formatted = format_output(capture.stdout_buffer().text(),
                                         capture.stderr_buffer().text(),
                                         config_.execution.max_output_size);
    result.output = formatted.text;
    result.truncated = formatted.truncated;
  }

  if (timed_out) {
    result.result.reset();
    result.error = ErrorRecord{.kind = ErrorKind::Timeout,
                               .message = "Execution timed out after " +
                                          std::to_string(timeout_seconds) + " seconds",
                               .violations = {},
                               .exception_type = "",
                               .traceback = ""};
  }
  result.ok = !result.error.has_value();

  // Drops every guest object, including helper closures over the deadline.
  globals.clear();
  return result;
}

} // namespace codebox::engine
