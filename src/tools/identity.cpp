#include "codebox/tools/identity.hpp"

#include "codebox/common/fs.hpp"

namespace codebox::tools {

namespace {

bool is_identity_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '.' || ch == '_' || ch == '-';
}

bool is_edge_char(const char ch) { return ch == '.' || ch == '_' || ch == '-'; }

std::optional<std::string> header_value(
    const std::unordered_map<std::string, std::string> &headers, const std::string &primary,
    const std::string &fallback) {
  std::optional<std::string> fallback_value;
  for (const auto &[key, value] : headers) {
    const std::string lowered = common::to_lower(key);
    if (lowered == primary) {
      if (auto clean = sanitize_identity(value)) {
        return clean;
      }
    } else if (lowered == fallback && !fallback_value.has_value()) {
      fallback_value = sanitize_identity(value);
    }
  }
  return fallback_value;
}

} // namespace

std::optional<std::string> sanitize_identity(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  bool in_run = false;
  for (const char ch : value) {
    if (is_identity_char(ch)) {
      out.push_back(ch);
      in_run = false;
    } else if (!in_run) {
      out.push_back('_');
      in_run = true;
    }
  }

  std::size_t begin = 0;
  std::size_t end = out.size();
  while (begin < end && is_edge_char(out[begin])) {
    ++begin;
  }
  while (end > begin && is_edge_char(out[end - 1])) {
    --end;
  }
  if (begin == end) {
    return std::nullopt;
  }
  return out.substr(begin, end - begin);
}

ToolContext identity_from_headers(const std::unordered_map<std::string, std::string> &headers) {
  ToolContext context;
  context.session_id = header_value(headers, "mcp-session-id", "x-session-id");
  context.run_id = header_value(headers, "mcp-run-id", "x-run-id");
  return context;
}

} // namespace codebox::tools
