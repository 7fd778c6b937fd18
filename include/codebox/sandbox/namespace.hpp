#pragma once

#include "codebox/sandbox/library_catalog.hpp"
#include "codebox/sandbox/python.hpp"
#include "codebox/security/policy.hpp"

#include <string>
#include <vector>

namespace codebox::sandbox {

/// Builds the globals for one execution: a restricted builtins table with the
/// sealed importer, plus every loaded catalog binding. Requires the GIL and a
/// started Runtime.
class NamespaceBuilder {
public:
  explicit NamespaceBuilder(const LibraryCatalog &catalog,
                            const security::PolicySet &policy = security::default_policy());

  [[nodiscard]] common::Result<py::dict> build() const;

  /// Builtins exposed to guest code, before denied entries are filtered.
  [[nodiscard]] static const std::vector<std::string> &builtin_names();

private:
  [[nodiscard]] py::dict build_builtins() const;

  const LibraryCatalog &catalog_;
  const security::PolicySet &policy_;
};

} // namespace codebox::sandbox
