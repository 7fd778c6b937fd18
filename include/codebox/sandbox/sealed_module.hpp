#pragma once

#include "codebox/sandbox/python.hpp"
#include "codebox/security/policy.hpp"

#include <string>

namespace codebox::sandbox {

/// Read-only view over a module: private names, denied members and submodules
/// outside the allowlist are unreachable through it.
class SealedModule {
public:
  SealedModule(py::object module, const security::PolicySet &policy);

  /// `__getattribute__`; raises AttributeError for anything hidden.
  [[nodiscard]] py::object attribute(const std::string &name) const;

  /// `__setattr__` / `__delattr__`; always raises AttributeError.
  [[noreturn]] void reject_write(const std::string &name) const;

  [[nodiscard]] std::string repr() const;
  [[nodiscard]] std::string name() const;

private:
  py::object module_;
  const security::PolicySet *policy_;
};

/// Adds the SealedModule class to the embedded `codebox` module.
void register_sealed_module(py::module_ &scope);

/// Wraps `module` unless it is already sealed. `policy` must outlive the view.
[[nodiscard]] py::object seal_module(const py::object &module, const security::PolicySet &policy);

[[nodiscard]] bool is_sealed_module(const py::handle &object);

/// The `__import__` placed in sandbox builtins.
[[nodiscard]] py::cpp_function sealed_importer(const security::PolicySet &policy);

} // namespace codebox::sandbox
