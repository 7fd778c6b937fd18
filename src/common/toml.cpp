#include "codebox/common/toml.hpp"

#include "codebox/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace codebox::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
    } else if (quote != '\0' && ch == quote && (quote == '\'' || line[i - 1] != '\\')) {
      quote = '\0';
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

// Basic strings honour the escapes TOML defines for them; literal strings are verbatim.
std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

template <typename T> bool parse_integer(const std::string &raw, T &out) {
  std::string normalized;
  normalized.reserve(raw.size());
  for (const char ch : trim(raw)) {
    if (ch != '_') {
      normalized.push_back(ch);
    }
  }
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.back() != ']' || starts_with(clean_line, "[[")) {
        return Result<TomlDocument>::failure("Unsupported table header at line " +
                                             std::to_string(line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace codebox::common
