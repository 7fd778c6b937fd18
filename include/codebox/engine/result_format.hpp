#pragma once

#include "codebox/sandbox/library_catalog.hpp"
#include "codebox/sandbox/python.hpp"

#include <optional>
#include <string>

namespace codebox::engine {

enum class ResultKind { None, Scalar, Text, Tabular, Series, Array, Other };

/// Tabular, Series and Array are recognized only when pandas or numpy is loaded.
[[nodiscard]] ResultKind classify_result(py::handle value, const sandbox::LibraryCatalog &catalog);

/// Text shown to the caller for a result value; nullopt for None. Requires the
/// GIL. A raising __repr__ or preview falls back to the type name.
[[nodiscard]] std::optional<std::string> format_result(py::handle value,
                                                       const sandbox::LibraryCatalog &catalog);

} // namespace codebox::engine
