#include "codebox/sandbox/library_catalog.hpp"

#include "codebox/observability/global.hpp"

#include <unordered_map>

namespace codebox::sandbox {

namespace {

LibraryGroup module_group(const std::string &name) {
  return LibraryGroup{.name = name, .alias = "", .optional = false, .bindings = {{name, name, ""}}};
}

std::vector<LibraryGroup> build_default_groups() {
  std::vector<LibraryGroup> groups;
  for (const char *name : {"json", "math", "statistics", "re", "itertools", "functools", "base64",
                           "hashlib", "uuid", "csv", "random"}) {
    groups.push_back(module_group(name));
  }
  groups.push_back({.name = "datetime",
                    .alias = "",
                    .optional = false,
                    .bindings = {{"datetime", "datetime", ""},
                                 {"date", "datetime", "date"},
                                 {"timedelta", "datetime", "timedelta"}}});
  groups.push_back({.name = "collections",
                    .alias = "",
                    .optional = false,
                    .bindings = {{"collections", "collections", ""},
                                 {"Counter", "collections", "Counter"},
                                 {"defaultdict", "collections", "defaultdict"},
                                 {"OrderedDict", "collections", "OrderedDict"}}});
  groups.push_back({.name = "copy",
                    .alias = "",
                    .optional = false,
                    .bindings = {{"copy", "copy", ""}, {"deepcopy", "copy", "deepcopy"}}});
  groups.push_back({.name = "io",
                    .alias = "",
                    .optional = false,
                    .bindings = {{"io", "io", ""},
                                 {"StringIO", "io", "StringIO"},
                                 {"BytesIO", "io", "BytesIO"}}});
  groups.push_back({.name = "decimal",
                    .alias = "",
                    .optional = false,
                    .bindings = {{"decimal", "decimal", ""}, {"Decimal", "decimal", "Decimal"}}});

  groups.push_back({.name = "numpy",
                    .alias = "np",
                    .optional = true,
                    .bindings = {{"np", "numpy", ""}, {"numpy", "numpy", ""}}});
  groups.push_back({.name = "pandas",
                    .alias = "pd",
                    .optional = true,
                    .bindings = {{"pd", "pandas", ""}, {"pandas", "pandas", ""}}});
  groups.push_back({.name = "scipy",
                    .alias = "",
                    .optional = true,
                    .bindings = {{"scipy", "scipy", ""}, {"scipy_stats", "scipy.stats", ""}}});
  groups.push_back({.name = "sklearn",
                    .alias = "",
                    .optional = true,
                    .bindings = {{"sklearn", "sklearn", ""},
                                 {"preprocessing", "sklearn.preprocessing", ""},
                                 {"cluster", "sklearn.cluster", ""},
                                 {"linear_model", "sklearn.linear_model", ""},
                                 {"tree", "sklearn.tree", ""},
                                 {"ensemble", "sklearn.ensemble", ""},
                                 {"metrics", "sklearn.metrics", ""},
                                 {"model_selection", "sklearn.model_selection", ""},
                                 {"train_test_split", "sklearn.model_selection",
                                  "train_test_split"}}});
  groups.push_back({.name = "statsmodels",
                    .alias = "sm",
                    .optional = true,
                    .bindings = {{"statsmodels", "statsmodels", ""},
                                 {"sm", "statsmodels.api", ""}}});
  return groups;
}

std::string module_version(const py::module_ &module) {
  if (!py::hasattr(module, "__version__")) {
    return "";
  }
  auto text = str_of(module.attr("__version__"));
  return text.ok() ? text.value() : "";
}

LoadedLibrary load_group(const LibraryGroup &group) {
  LoadedLibrary loaded{.name = group.name,
                       .alias = group.alias,
                       .optional = group.optional,
                       .status = LibraryStatus::Loaded,
                       .version = "",
                       .error = "",
                       .values = {}};
  std::unordered_map<std::string, py::module_> imported;

  for (const auto &binding : group.bindings) {
    try {
      auto it = imported.find(binding.module);
      if (it == imported.end()) {
        it = imported.emplace(binding.module, py::module_::import(binding.module.c_str())).first;
      }
      if (binding.attribute.empty()) {
        loaded.values.emplace_back(binding.name, it->second);
      } else {
        loaded.values.emplace_back(binding.name, it->second.attr(binding.attribute.c_str()));
      }
    } catch (const py::error_already_set &error) {
      const bool missing = error.matches(PyExc_ModuleNotFoundError);
      loaded.status =
          missing && group.optional ? LibraryStatus::NotInstalled : LibraryStatus::Failed;
      loaded.error = describe(error);
      loaded.values.clear();
      return loaded;
    }
  }

  if (!group.bindings.empty()) {
    if (const auto it = imported.find(group.bindings.front().module); it != imported.end()) {
      loaded.version = module_version(it->second);
    }
  }
  return loaded;
}

} // namespace

std::string library_status_to_string(const LibraryStatus status) {
  switch (status) {
  case LibraryStatus::Loaded:
    return "loaded";
  case LibraryStatus::NotInstalled:
    return "not_installed";
  case LibraryStatus::Failed:
    return "failed";
  }
  return "failed";
}

const std::vector<LibraryGroup> &default_library_groups() {
  static const std::vector<LibraryGroup> groups = build_default_groups();
  return groups;
}

LibraryCatalog::LibraryCatalog() : LibraryCatalog(default_library_groups()) {}

LibraryCatalog::LibraryCatalog(std::vector<LibraryGroup> groups) : groups_(std::move(groups)) {}

void LibraryCatalog::load() {
  libraries_.clear();
  libraries_.reserve(groups_.size());
  for (const auto &group : groups_) {
    LoadedLibrary loaded = load_group(group);
    observability::record_library_probe(loaded.name, library_status_to_string(loaded.status));
    if (loaded.status == LibraryStatus::Failed) {
      observability::record_error("library_catalog", loaded.name + ": " + loaded.error);
    }
    libraries_.push_back(std::move(loaded));
  }
}

const LoadedLibrary *LibraryCatalog::find(const std::string &name) const {
  for (const auto &library : libraries_) {
    if (library.name == name) {
      return &library;
    }
  }
  return nullptr;
}

bool LibraryCatalog::is_loaded(const std::string &name) const {
  const auto *library = find(name);
  return library != nullptr && library->status == LibraryStatus::Loaded;
}

py::handle LibraryCatalog::module(const std::string &module_name) const {
  for (std::size_t i = 0; i < groups_.size() && i < libraries_.size(); ++i) {
    if (libraries_[i].status != LibraryStatus::Loaded) {
      continue;
    }
    const auto &bindings = groups_[i].bindings;
    for (std::size_t j = 0; j < bindings.size() && j < libraries_[i].values.size(); ++j) {
      if (bindings[j].module == module_name && bindings[j].attribute.empty()) {
        return libraries_[i].values[j].second;
      }
    }
  }
  return {};
}

std::optional<std::string> LibraryCatalog::hard_failure() const {
  for (const auto &library : libraries_) {
    if (library.status == LibraryStatus::Failed) {
      return "Failed to load library '" + library.name + "': " + library.error;
    }
  }
  return std::nullopt;
}

} // namespace codebox::sandbox
