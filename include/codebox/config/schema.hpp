#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace codebox::config {

struct ExecutionConfig {
  std::uint32_t default_timeout_seconds = 30;
  std::uint32_t max_timeout_seconds = 120;
  std::size_t max_output_size = 100'000;
};

struct ArtifactStoreConfig {
  std::string url;
  std::optional<std::string> token;
  std::uint32_t fetch_timeout_seconds = 30;
  std::uint32_t upload_timeout_seconds = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  ExecutionConfig execution;
  ArtifactStoreConfig artifact_store;
  ObservabilityConfig observability;
};

} // namespace codebox::config
