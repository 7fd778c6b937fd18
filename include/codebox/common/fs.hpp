#pragma once

#include "codebox/common/result.hpp"

#include <filesystem>
#include <string>

namespace codebox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file as bytes.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Lowercase hex SHA-256 of `data`.
[[nodiscard]] std::string sha256_hex(const std::string &data);

} // namespace codebox::common
