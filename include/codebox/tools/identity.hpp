#pragma once

#include "codebox/tools/tool.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace codebox::tools {

/// Runs of characters outside [A-Za-z0-9._-] become '_', then leading and
/// trailing '.', '_' and '-' are stripped. Empty input or output yields nullopt.
[[nodiscard]] std::optional<std::string> sanitize_identity(const std::string &value);

/// Session from mcp-session-id or x-session-id, run from mcp-run-id or
/// x-run-id. Header names match case-insensitively; the mcp- form wins.
[[nodiscard]] ToolContext
identity_from_headers(const std::unordered_map<std::string, std::string> &headers);

} // namespace codebox::tools
