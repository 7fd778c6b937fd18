#include "codebox/sandbox/sealed_module.hpp"

namespace codebox::sandbox {

namespace {

bool is_public_dunder(const std::string &name) {
  return name == "__name__" || name == "__doc__" || name == "__version__";
}

void check_fromlist(const std::string &module_name, const py::object &fromlist,
                    const security::PolicySet &policy) {
  for (const auto item : fromlist) {
    if (!py::isinstance<py::str>(item)) {
      throw py::type_error("fromlist entries must be strings");
    }
    const std::string member = utf8(item);
    if (member == "*") {
      throw py::import_error("wildcard imports are not supported in the sandbox");
    }
    if (member.empty() || member.front() == '_' || policy.is_member_denied(module_name, member) ||
        policy.is_module_denied(module_name + "." + member)) {
      throw py::import_error("cannot import name '" + member + "' from '" + module_name + "'");
    }
  }
}

} // namespace

SealedModule::SealedModule(py::object module, const security::PolicySet &policy)
    : module_(std::move(module)), policy_(&policy) {}

py::object SealedModule::attribute(const std::string &name) const {
  const std::string module_name = this->name();
  const bool hidden = name.empty() || (name.front() == '_' && !is_public_dunder(name));
  if (hidden || policy_->is_member_denied(module_name, name)) {
    throw py::attribute_error("module '" + module_name + "' has no accessible attribute '" + name +
                              "'");
  }

  py::object value = module_.attr(name.c_str());
  if (!py::isinstance<py::module_>(value)) {
    return value;
  }
  const std::string submodule = utf8(value.attr("__name__"));
  if (!policy_->is_module_allowed(submodule)) {
    throw py::attribute_error("module '" + submodule + "' is not available in the sandbox");
  }
  return seal_module(value, *policy_);
}

void SealedModule::reject_write(const std::string &name) const {
  throw py::attribute_error("cannot modify '" + name + "' on read-only module '" + this->name() +
                            "'");
}

std::string SealedModule::repr() const { return "<module '" + name() + "' (sealed)>"; }

std::string SealedModule::name() const {
  if (!py::hasattr(module_, "__name__")) {
    return "";
  }
  return utf8(module_.attr("__name__"));
}

void register_sealed_module(py::module_ &scope) {
  py::class_<SealedModule>(scope, "SealedModule",
                           "Read-only view of a module inside the sandbox.")
      .def("__getattribute__", &SealedModule::attribute)
      .def("__setattr__", [](const SealedModule &self, const std::string &name,
                             const py::object &) { self.reject_write(name); })
      .def("__delattr__",
           [](const SealedModule &self, const std::string &name) { self.reject_write(name); })
      .def("__repr__", &SealedModule::repr);
}

py::object seal_module(const py::object &module, const security::PolicySet &policy) {
  if (is_sealed_module(module)) {
    return module;
  }
  return py::cast(SealedModule(module, policy));
}

bool is_sealed_module(const py::handle &object) {
  return object && py::isinstance<SealedModule>(object);
}

py::cpp_function sealed_importer(const security::PolicySet &policy) {
  const security::PolicySet *rules = &policy;
  return py::cpp_function(
      [rules](const std::string &name, const py::object &globals, const py::object &locals,
              const py::object &fromlist, int level) -> py::object {
        if (level != 0) {
          throw py::import_error("relative imports are not supported in the sandbox");
        }
        switch (rules->classify_module(name)) {
        case security::ModuleVerdict::Allowed:
          break;
        case security::ModuleVerdict::Denied:
          throw py::import_error("import of '" + name + "' is blocked in the sandbox");
        case security::ModuleVerdict::Unlisted:
          throw py::import_error("import of '" + name + "' is not permitted in the sandbox");
        }

        const bool has_fromlist = !fromlist.is_none() && py::bool_(fromlist);
        if (has_fromlist) {
          check_fromlist(name, fromlist, *rules);
        }
        py::object module = py::module_::import("builtins")
                                .attr("__import__")(name, globals, locals,
                                                    has_fromlist ? fromlist : py::none(), 0);
        return seal_module(module, *rules);
      },
      py::name("__import__"), py::arg("name"), py::arg("globals") = py::none(),
      py::arg("locals") = py::none(), py::arg("fromlist") = py::tuple(), py::arg("level") = 0,
      "Import an allowlisted module as a read-only view.");
}

} // namespace codebox::sandbox
