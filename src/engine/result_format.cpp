#include "codebox/engine/result_format.hpp"

namespace codebox::engine {

namespace {

constexpr std::size_t kPreviewRows = 10;
constexpr std::size_t kArrayChars = 1000;
constexpr std::size_t kReprChars = 5000;

bool is_instance_of(py::handle value, py::handle module, const char *type_name) {
  if (!module || !py::hasattr(module, type_name)) {
    return false;
  }
  return py::isinstance(value, module.attr(type_name));
}

/// First `limit` characters (not bytes) of `text`.
std::string prefix_chars(const py::str &text, std::size_t limit) {
  if (py::len(text) <= limit) {
    return sandbox::utf8(text);
  }
  return sandbox::utf8(text[py::slice(0, static_cast<py::ssize_t>(limit), 1)]);
}

std::string preview_head(py::handle value) {
  return sandbox::utf8(py::str(value.attr("head")(kPreviewRows).attr("to_string")()));
}

std::string format_tabular(py::handle value) {
  const auto shape = value.attr("shape").cast<py::tuple>();
  if (shape.size() != 2) {
    throw py::value_error("DataFrame has no two-dimensional shape");
  }
  return "DataFrame(" + std::to_string(shape[0].cast<long long>()) + " rows, " +
         std::to_string(shape[1].cast<long long>()) + " columns):\n" + preview_head(value);
}

std::string format_series(py::handle value) {
  return "Series(" + std::to_string(py::len(value)) + " items):\n" + preview_head(value);
}

std::string format_array(py::handle value) {
  return "ndarray(shape=" + sandbox::utf8(py::str(value.attr("shape"))) + "):\n" +
         prefix_chars(py::str(value), kArrayChars);
}

std::string type_fallback(py::handle value) {
  auto text = sandbox::str_of(py::type::handle_of(value));
  return text.ok() ? text.value() : "<unrepresentable result>";
}

} // namespace

ResultKind classify_result(py::handle value, const sandbox::LibraryCatalog &catalog) {
  if (!value || value.is_none()) {
    return ResultKind::None;
  }
  if (py::isinstance<py::bool_>(value) || py::isinstance<py::int_>(value) ||
      py::isinstance<py::float_>(value) || PyComplex_Check(value.ptr())) {
    return ResultKind::Scalar;
  }
  if (py::isinstance<py::str>(value) || py::isinstance<py::bytes>(value)) {
    return ResultKind::Text;
  }
  const py::handle pandas = catalog.module("pandas");
  if (is_instance_of(value, pandas, "DataFrame")) {
    return ResultKind::Tabular;
  }
  if (is_instance_of(value, pandas, "Series")) {
    return ResultKind::Series;
  }
  if (is_instance_of(value, catalog.module("numpy"), "ndarray")) {
    return ResultKind::Array;
  }
  return ResultKind::Other;
}

std::optional<std::string> format_result(py::handle value, const sandbox::LibraryCatalog &catalog) {
  try {
    switch (classify_result(value, catalog)) {
    case ResultKind::None:
      return std::nullopt;
    case ResultKind::Tabular:
      return format_tabular(value);
    case ResultKind::Series:
      return format_series(value);
    case ResultKind::Array:
      return format_array(value);
    case ResultKind::Scalar:
    case ResultKind::Text:
    case ResultKind::Other:
      break;
    }
    return prefix_chars(py::repr(value), kReprChars);
  } catch (const py::error_already_set &) {
    return type_fallback(value);
  } catch (const py::cast_error &) {
    return type_fallback(value);
  }
}

} // namespace codebox::engine
