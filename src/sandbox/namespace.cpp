#include "codebox/sandbox/namespace.hpp"

#include "codebox/sandbox/sealed_module.hpp"

namespace codebox::sandbox {

NamespaceBuilder::NamespaceBuilder(const LibraryCatalog &catalog,
                                   const security::PolicySet &policy)
    : catalog_(catalog), policy_(policy) {}

const std::vector<std::string> &NamespaceBuilder::builtin_names() {
  static const std::vector<std::string> names = {
      "True", "False", "None",
      // numbers
      "abs", "bin", "bool", "complex", "divmod", "float", "hex", "int", "oct", "pow", "round",
      // iteration
      "all", "any", "enumerate", "filter", "iter", "len", "map", "max", "min", "next", "range",
      "reversed", "sorted", "sum", "zip",
      // containers and types
      "bytes", "bytearray", "dict", "frozenset", "list", "object", "set", "slice", "str", "tuple",
      "callable", "isinstance", "issubclass", "type",
      // text
      "ascii", "chr", "format", "hash", "id", "ord", "repr", "print",
      // exceptions
      "Exception", "BaseException", "ValueError", "TypeError", "KeyError", "IndexError",
      "AttributeError", "RuntimeError", "ZeroDivisionError", "StopIteration", "FileNotFoundError",
      "ImportError", "ModuleNotFoundError", "NameError", "OverflowError", "RecursionError",
      "NotImplementedError", "AssertionError", "ArithmeticError", "LookupError", "UnicodeError",
      "UnicodeDecodeError", "UnicodeEncodeError", "Warning",
      // classes
      "__build_class__", "super", "property", "staticmethod", "classmethod",
  };
  return names;
}

py::dict NamespaceBuilder::build_builtins() const {
  const py::dict real = py::module_::import("builtins").attr("__dict__");
  py::dict builtins;
  for (const auto &name : builtin_names()) {
    if (policy_.is_builtin_denied(name) || !real.contains(name)) {
      continue;
    }
    builtins[name.c_str()] = real[name.c_str()];
  }
  builtins["__import__"] = sealed_importer(policy_);
  return builtins;
}

common::Result<py::dict> NamespaceBuilder::build() const {
  try {
    py::dict globals;
    globals["__builtins__"] = build_builtins();
    globals["__name__"] = "__main__";
    globals["__doc__"] = py::none();

    for (const auto &library : catalog_.libraries()) {
      if (library.status != LibraryStatus::Loaded) {
        continue;
      }
      for (const auto &[name, value] : library.values) {
        globals[name.c_str()] =
            py::isinstance<py::module_>(value) ? seal_module(value, policy_) : value;
      }
    }
    return common::Result<py::dict>::success(std::move(globals));
  } catch (const py::error_already_set &error) {
    return common::Result<py::dict>::failure("namespace: " + describe(error));
  }
}

} // namespace codebox::sandbox
