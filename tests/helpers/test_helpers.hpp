#pragma once

#include "codebox/artifacts/store.hpp"
#include "codebox/config/schema.hpp"
#include "codebox/observability/observer.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codebox::testing {

/// Defaults with observability off and a short timeout budget.
config::Config mock_config();

/// Starts the embedded runtime; throws when it cannot start.
void start_runtime();

struct RecordedUpload {
  std::string session_id;
  std::string path;
  std::string data;
  std::string content_type;
};

/// In-memory artifact store keyed by "{session}/{path}".
class FakeArtifactStore final : public artifacts::IArtifactStore {
public:
  void put(const std::string &session_id, const std::string &path, std::string data);
  void set_configured(bool configured) { configured_ = configured; }
  void set_upload_response(std::string body) { upload_response_ = std::move(body); }

  [[nodiscard]] bool configured() const override { return configured_; }
  [[nodiscard]] common::Result<std::string> fetch(const std::string &session_id,
                                                  const std::string &path,
                                                  std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Result<std::string> upload(const std::string &session_id,
                                                   const std::string &canonical_path,
                                                   const std::string &data,
                                                   const std::string &content_type,
                                                   std::chrono::milliseconds timeout) override;

  [[nodiscard]] std::vector<RecordedUpload> uploads() const;
  [[nodiscard]] std::optional<std::chrono::milliseconds> last_timeout() const;

private:
  mutable std::mutex mutex_;
  bool configured_ = true;
  std::map<std::string, std::string> files_;
  std::vector<RecordedUpload> uploads_;
  std::string upload_response_ =
      R"({"ok":true,"artifact":{"name":"out","path":"p","url":"u","content_type":"c","size_bytes":0}})";
  std::optional<std::chrono::milliseconds> last_timeout_;
};

/// Keeps every event it sees; installs itself as the global observer while alive.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

/// Installs a RecordingObserver globally and removes it on destruction.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] const RecordingObserver &observer() const { return *observer_; }

private:
  RecordingObserver *observer_;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

} // namespace codebox::testing
