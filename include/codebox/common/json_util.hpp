#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codebox::common {

/// Escape a string for embedding inside a JSON string literal. Control characters
/// are written as \uXXXX so captured program output always yields valid JSON.
[[nodiscard]] std::string json_escape(const std::string &value);

/// json_escape wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX sequences (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field extractors. Each returns an empty value when the field is missing or of
/// another type. The first occurrence of the key wins, so callers narrow the
/// document with json_get_object before reading nested fields.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_literal(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

} // namespace codebox::common
