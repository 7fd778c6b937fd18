#pragma once

#include "codebox/artifacts/store.hpp"
#include "codebox/sandbox/python.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codebox::artifacts {

/// Everything a helper call needs. Owned jointly by the bound functions, so a
/// helper that outlives its execution fails cleanly on the spent deadline.
struct HelperContext {
  std::string session_id;
  std::optional<std::string> run_id;
  std::shared_ptr<IArtifactStore> store;
  std::chrono::steady_clock::time_point deadline;
  std::chrono::milliseconds fetch_timeout{30'000};
  std::chrono::milliseconds upload_timeout{60'000};
  bool pandas_available = false;
};

/// Binds fetch_artifact, fetch_artifact_json, fetch_artifact_csv,
/// upload_artifact, upload_dataframe, _session_id and _run_id into `globals`.
/// Each bound function holds its own reference to `context`. Requires the GIL.
[[nodiscard]] common::Status bind_helpers(py::dict &globals,
                                          const std::shared_ptr<HelperContext> &context);

[[nodiscard]] const std::vector<std::string> &helper_signatures();

} // namespace codebox::artifacts
