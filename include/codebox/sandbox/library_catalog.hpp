#pragma once

#include "codebox/sandbox/python.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codebox::sandbox {

/// One name bound into every namespace: `name = module` or `name = module.attribute`.
struct LibraryBinding {
  std::string name;
  std::string module;
  std::string attribute;
};

struct LibraryGroup {
  std::string name;
  std::string alias;
  bool optional = false;
  std::vector<LibraryBinding> bindings;
};

enum class LibraryStatus { Loaded, NotInstalled, Failed };

[[nodiscard]] std::string library_status_to_string(LibraryStatus status);

struct LoadedLibrary {
  std::string name;
  std::string alias;
  bool optional = false;
  LibraryStatus status = LibraryStatus::NotInstalled;
  std::string version;
  std::string error;
  std::vector<std::pair<std::string, py::object>> values;
};

/// Standard-library groups first (always required), then the optional
/// data-analysis stack.
[[nodiscard]] const std::vector<LibraryGroup> &default_library_groups();

/// Imports every group once and keeps the resulting objects for the life of the
/// process. A missing optional group is recorded as NotInstalled; any other import
/// failure, or a missing required group, is a hard failure.
class LibraryCatalog {
public:
  LibraryCatalog();
  explicit LibraryCatalog(std::vector<LibraryGroup> groups);

  LibraryCatalog(const LibraryCatalog &) = delete;
  LibraryCatalog &operator=(const LibraryCatalog &) = delete;
  LibraryCatalog(LibraryCatalog &&) = default;
  LibraryCatalog &operator=(LibraryCatalog &&) = default;

  /// Requires the GIL.
  void load();

  [[nodiscard]] const std::vector<LoadedLibrary> &libraries() const { return libraries_; }
  [[nodiscard]] const LoadedLibrary *find(const std::string &name) const;
  [[nodiscard]] bool is_loaded(const std::string &name) const;

  /// A loaded module, or a null handle.
  [[nodiscard]] py::handle module(const std::string &module_name) const;

  [[nodiscard]] std::optional<std::string> hard_failure() const;

private:
  std::vector<LibraryGroup> groups_;
  std::vector<LoadedLibrary> libraries_;
};

} // namespace codebox::sandbox
