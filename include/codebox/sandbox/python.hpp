#pragma once

// pybind11 pulls in Python.h, which must precede the standard headers.
#include <pybind11/embed.h>

#include "codebox/common/result.hpp"

#include <string>

namespace codebox {

namespace py = pybind11;

namespace sandbox {

/// One-line summary of a Python error ("TypeError: ..."), without its traceback.
[[nodiscard]] std::string describe(const py::error_already_set &error);

/// UTF-8 text of a str object, with surrogates replaced rather than raising.
[[nodiscard]] std::string utf8(py::handle text);

/// UTF-8 text of str(object) / repr(object). A raising __str__/__repr__ is
/// reported as a failure carrying the error summary.
[[nodiscard]] common::Result<std::string> str_of(py::handle object);
[[nodiscard]] common::Result<std::string> repr_of(py::handle object);

/// Name of the object's type, e.g. "bytes".
[[nodiscard]] std::string type_name(py::handle object);

} // namespace sandbox

} // namespace codebox
