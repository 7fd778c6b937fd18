#include "codebox/sandbox/python.hpp"

namespace codebox::sandbox {

std::string describe(const py::error_already_set &error) {
  const std::string name = type_name(error.value());
  std::string message;
  try {
    message = utf8(py::str(error.value()));
  } catch (const py::error_already_set &) {
    message = "<exception str() failed>";
  }
  return message.empty() ? name : name + ": " + message;
}

std::string utf8(py::handle text) {
  if (!text || !PyUnicode_Check(text.ptr())) {
    return "";
  }
  auto encoded =
      py::reinterpret_steal<py::object>(PyUnicode_AsEncodedString(text.ptr(), "utf-8", "replace"));
  if (!encoded) {
    PyErr_Clear();
    return "";
  }
  return std::string(py::bytes(encoded));
}

common::Result<std::string> str_of(py::handle object) {
  try {
    return common::Result<std::string>::success(utf8(py::str(object)));
  } catch (const py::error_already_set &error) {
    return common::Result<std::string>::failure(describe(error));
  }
}

common::Result<std::string> repr_of(py::handle object) {
  try {
    return common::Result<std::string>::success(utf8(py::repr(object)));
  } catch (const py::error_already_set &error) {
    return common::Result<std::string>::failure(describe(error));
  }
}

std::string type_name(py::handle object) {
  if (!object) {
    return "NoneType";
  }
  return utf8(py::str(py::type::handle_of(object).attr("__name__")));
}

} // namespace codebox::sandbox
