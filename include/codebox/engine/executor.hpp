#pragma once

#include "codebox/artifacts/store.hpp"
#include "codebox/config/schema.hpp"
#include "codebox/security/policy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codebox::engine {

struct ExecutionRequest {
  std::string code;
  std::optional<std::uint32_t> timeout_seconds;
  std::optional<std::string> session_id;
  std::optional<std::string> run_id;
};

enum class ErrorKind { Validation, Import, Timeout, Execution };

[[nodiscard]] std::string error_kind_to_string(ErrorKind kind);

struct ErrorRecord {
  ErrorKind kind = ErrorKind::Execution;
  std::string message;
  std::vector<std::string> violations;
  std::string exception_type;
  std::string traceback;
};

struct ExecutionResult {
  bool ok = false;
  std::string output;
  std::optional<std::string> result;
  std::optional<ErrorRecord> error;
  bool truncated = false;
};

[[nodiscard]] std::string to_json(const ExecutionResult &result);

struct FormattedOutput {
  std::string text;
  bool truncated = false;
};

/// stdout, then "\n[stderr]:\n" and stderr when stderr is non-empty. Past
/// `max_bytes` the text is cut and a marker naming the limit is appended. The cut
/// never splits a UTF-8 sequence.
[[nodiscard]] FormattedOutput format_output(const std::string &stdout_text,
                                            const std::string &stderr_text, std::size_t max_bytes);

/// Requested (or default) timeout clamped to [1, max_timeout_seconds].
[[nodiscard]] std::uint32_t clamp_timeout(std::optional<std::uint32_t> requested,
                                          const config::ExecutionConfig &config);

/// Lines of a formatted traceback that belong to guest code, plus every line
/// that is not a frame header.
[[nodiscard]] std::string clean_traceback(const std::string &traceback);

class Executor {
public:
  Executor(config::Config config, std::shared_ptr<artifacts::IArtifactStore> store,
           const security::PolicySet &policy = security::default_policy());

  /// Validates and runs one request in a fresh namespace. Never throws; every
  /// failure comes back as an ErrorRecord.
  [[nodiscard]] ExecutionResult execute(const ExecutionRequest &request);

  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  [[nodiscard]] ExecutionResult run_locked(const ExecutionRequest &request,
                                           std::uint32_t timeout_seconds,
                                           const std::string &digest);

  config::Config config_;
  std::shared_ptr<artifacts::IArtifactStore> store_;
  const security::PolicySet &policy_;
};

} // namespace codebox::engine
