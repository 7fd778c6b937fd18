#pragma once

#include "codebox/sandbox/library_catalog.hpp"
#include "codebox/sandbox/python.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace codebox::sandbox {

/// Fills the embedded `codebox` module: SealedModule, OutputSink and
/// ExecutionTimeout.
void register_host_module(py::module_ &scope);

/// The process-wide embedded interpreter. Started once, never finalized.
class Runtime {
public:
  [[nodiscard]] static Runtime &instance();

  /// Initializes the interpreter, the sandbox types and the library catalog.
  /// Idempotent; later calls return the first outcome. Call without the GIL.
  /// Afterwards any thread may take the GIL with py::gil_scoped_acquire.
  [[nodiscard]] common::Status start();

  [[nodiscard]] bool running() const;
  [[nodiscard]] const LibraryCatalog &catalog() const { return catalog_; }

  /// `ExecutionTimeout`, a BaseException subclass so `except Exception` misses it.
  [[nodiscard]] py::handle timeout_error() const { return timeout_error_; }

  [[nodiscard]] std::string python_version() const;

  /// Serializes guest executions. Acquire before the GIL.
  [[nodiscard]] std::mutex &execution_gate() { return execution_gate_; }

private:
  Runtime() = default;

  [[nodiscard]] common::Status initialize();
  [[nodiscard]] common::Status prepare_sandbox();

  std::once_flag once_;
  std::optional<common::Status> status_;
  LibraryCatalog catalog_;
  py::object timeout_error_;
  std::unique_ptr<py::gil_scoped_release> released_;
  std::mutex execution_gate_;
};

} // namespace codebox::sandbox
