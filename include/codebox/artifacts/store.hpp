#pragma once

#include "codebox/common/result.hpp"
#include "codebox/config/schema.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace codebox::artifacts {

/// The remote store guest helpers read from and write to. Implementations are
/// called without the GIL and must be safe to use from any thread.
class IArtifactStore {
public:
  virtual ~IArtifactStore() = default;

  [[nodiscard]] virtual bool configured() const = 0;

  /// Raw bytes stored at `path` within the session.
  [[nodiscard]] virtual common::Result<std::string> fetch(const std::string &session_id,
                                                          const std::string &path,
                                                          std::chrono::milliseconds timeout) = 0;

  /// Stores `data` at `canonical_path`; returns the store's JSON response body.
  [[nodiscard]] virtual common::Result<std::string>
  upload(const std::string &session_id, const std::string &canonical_path, const std::string &data,
         const std::string &content_type, std::chrono::milliseconds timeout) = 0;
};

class HttpArtifactStore final : public IArtifactStore {
public:
  explicit HttpArtifactStore(config::ArtifactStoreConfig config);
  ~HttpArtifactStore() override;

  HttpArtifactStore(const HttpArtifactStore &) = delete;
  HttpArtifactStore &operator=(const HttpArtifactStore &) = delete;

  [[nodiscard]] bool configured() const override { return !config_.url.empty(); }

  [[nodiscard]] common::Result<std::string> fetch(const std::string &session_id,
                                                  const std::string &path,
                                                  std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Result<std::string> upload(const std::string &session_id,
                                                   const std::string &canonical_path,
                                                   const std::string &data,
                                                   const std::string &content_type,
                                                   std::chrono::milliseconds timeout) override;

  /// `{base}/artifacts/{session}/{path}` with each path segment percent-encoded.
  [[nodiscard]] std::string artifact_url(const std::string &session_id,
                                         const std::string &path) const;

private:
  config::ArtifactStoreConfig config_;
};

/// Strips leading '/' characters.
[[nodiscard]] std::string normalize_artifact_path(const std::string &path);

/// Where an upload lands: paths already under "runs/" are kept, everything else
/// goes to "runs/{run_id}/{type}/{path}". Without a run id the path is returned
/// normalized.
[[nodiscard]] std::string build_canonical_path(const std::string &path,
                                               const std::optional<std::string> &run_id,
                                               const std::string &artifact_type = "results");

} // namespace codebox::artifacts
