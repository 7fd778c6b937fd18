#include "codebox/sandbox/runtime.hpp"

#include "codebox/observability/global.hpp"
#include "codebox/sandbox/output_capture.hpp"
#include "codebox/sandbox/sealed_module.hpp"
#include "codebox/security/policy.hpp"

#include <stdexcept>

namespace codebox::sandbox {

namespace {

/// Tag type for the Python-side ExecutionTimeout; never thrown from C++.
struct ExecutionTimeout {};

common::Status init_interpreter() {
  PyConfig config;
  PyConfig_InitPythonConfig(&config);
  config.parse_argv = 0;
  config.write_bytecode = 0;
  config.user_site_directory = 0;

  const PyStatus status = PyConfig_SetString(&config, &config.program_name, L"codebox");
  if (PyStatus_Exception(status)) {
    PyConfig_Clear(&config);
    return common::Status::error("failed to initialize Python: program name");
  }
  try {
    // No signal handlers: SIGINT belongs to the host.
    config.install_signal_handlers = 0;
    py::initialize_interpreter(&config, 0, nullptr, false);
  } catch (const std::exception &error) {
    PyConfig_Clear(&config);
    return common::Status::error(std::string("failed to initialize Python: ") + error.what());
  }
  PyConfig_Clear(&config);
  return common::Status::success();
}

} // namespace

void register_host_module(py::module_ &scope) {
  scope.doc() = "Host-side types of the codebox sandbox.";
  register_sealed_module(scope);
  register_output_sink(scope);
  // BaseException subclass so `except Exception` in guest code misses it.
  py::exception<ExecutionTimeout> timeout(scope, "ExecutionTimeout", PyExc_BaseException);
  timeout.doc() = "Raised inside guest code when its time budget runs out.";
}

Runtime &Runtime::instance() {
  // Leaked: the interpreter outlives static destruction.
  static auto *runtime = new Runtime();
  return *runtime;
}

common::Status Runtime::start() {
  std::call_once(once_, [this] {
    status_ = initialize();
    if (!status_->ok()) {
      observability::record_error("runtime", status_->error());
    }
  });
  return *status_;
}

bool Runtime::running() const { return status_.has_value() && status_->ok(); }

std::string Runtime::python_version() const {
  const std::string version = Py_GetVersion();
  const auto space = version.find(' ');
  return space == std::string::npos ? version : version.substr(0, space);
}

common::Status Runtime::initialize() {
  if (Py_IsInitialized() != 0) {
    py::gil_scoped_acquire gil;
    return prepare_sandbox();
  }

  auto status = init_interpreter();
  if (!status.ok()) {
    return status;
  }
  status = prepare_sandbox();
  // The initializing thread holds the GIL; hand it back once set up.
  released_ = std::make_unique<py::gil_scoped_release>();
  return status;
}

common::Status Runtime::prepare_sandbox() {
  try {
    auto host = py::module_::import("codebox");
    timeout_error_ = host.attr("ExecutionTimeout");
  } catch (const py::error_already_set &error) {
    return common::Status::error("sandbox types: " + describe(error));
  }

  catalog_.load();
  return common::Status::success();
}

} // namespace codebox::sandbox

PYBIND11_EMBEDDED_MODULE(codebox, m) { codebox::sandbox::register_host_module(m); }
