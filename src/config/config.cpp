#include "codebox/config/config.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace codebox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".codebox";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("CODEBOX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("CODEBOX_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Earlier files win because set_env_if_missing never overwrites.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

template <typename T> std::optional<T> env_number(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  T parsed{};
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::uint32_t clamp_u32(std::uint64_t value) {
  return static_cast<std::uint32_t>(
      std::min<std::uint64_t>(value, std::numeric_limits<std::uint32_t>::max()));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto value = env_number<std::uint64_t>("PYTHON_EXECUTION_TIMEOUT")) {
    config.execution.default_timeout_seconds = clamp_u32(*value);
  }
  if (const auto value = env_number<std::uint64_t>("PYTHON_MAX_TIMEOUT")) {
    config.execution.max_timeout_seconds = clamp_u32(*value);
  }
  if (const auto value = env_number<std::size_t>("PYTHON_MAX_OUTPUT_SIZE")) {
    config.execution.max_output_size = *value;
  }
  if (const char *url = std::getenv("ARTIFACT_STORE_URL"); url != nullptr && *url != '\0') {
    config.artifact_store.url = common::trim(url);
  }
  if (const char *token = std::getenv("ARTIFACT_STORE_TOKEN"); token != nullptr && *token != '\0') {
    config.artifact_store.token = std::string(token);
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &exec = config.execution;
  exec.default_timeout_seconds =
      clamp_u32(doc.get_u64("execution.default_timeout_seconds", exec.default_timeout_seconds));
  exec.max_timeout_seconds =
      clamp_u32(doc.get_u64("execution.max_timeout_seconds", exec.max_timeout_seconds));
  exec.max_output_size = static_cast<std::size_t>(
      doc.get_u64("execution.max_output_size", exec.max_output_size));

  auto &store = config.artifact_store;
  store.url = common::trim(expand_config_value(doc.get_string("artifact_store.url", store.url)));
  if (doc.has("artifact_store.token")) {
    const std::string token = expand_config_value(doc.get_string("artifact_store.token"));
    if (!common::trim(token).empty()) {
      store.token = token;
    }
  }
  store.fetch_timeout_seconds =
      clamp_u32(doc.get_u64("artifact_store.fetch_timeout_seconds", store.fetch_timeout_seconds));
  store.upload_timeout_seconds = clamp_u32(
      doc.get_u64("artifact_store.upload_timeout_seconds", store.upload_timeout_seconds));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &exec = config.execution;

  if (exec.max_timeout_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.max_timeout_seconds must be at least 1");
  }
  if (exec.default_timeout_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.default_timeout_seconds must be at least 1");
  }
  if (exec.default_timeout_seconds > exec.max_timeout_seconds) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.default_timeout_seconds exceeds execution.max_timeout_seconds");
  }
  if (exec.max_output_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.max_output_size must be at least 1");
  }

  const auto &store = config.artifact_store;
  if (!store.url.empty()) {
    const std::string lowered = common::to_lower(store.url);
    if (!common::starts_with(lowered, "http://") && !common::starts_with(lowered, "https://")) {
      return common::Result<std::vector<std::string>>::failure(
          "artifact_store.url must start with http:// or https://");
    }
    if (!store.token.has_value()) {
      warnings.push_back("artifact_store.token is not set; requests will be unauthenticated");
    }
  } else {
    warnings.push_back("artifact_store.url is not set; artifact helpers will fail when called");
  }
  const std::string level = common::to_lower(common::trim(config.observability.log_level));
  if (level != "debug" && level != "info" && level != "error") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.log_level: " +
                                                              config.observability.log_level);
  }

  if (store.fetch_timeout_seconds == 0 || store.upload_timeout_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "artifact_store timeouts must be at least 1 second");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace codebox::config
