#pragma once

#include "codebox/common/result.hpp"
#include "codebox/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codebox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then config.toml (if present), then environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Parse config text without touching the filesystem or environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// PYTHON_EXECUTION_TIMEOUT, PYTHON_MAX_TIMEOUT, PYTHON_MAX_OUTPUT_SIZE,
/// ARTIFACT_STORE_URL, ARTIFACT_STORE_TOKEN. Loads .env files first.
void apply_env_overrides(Config &config);

} // namespace codebox::config
