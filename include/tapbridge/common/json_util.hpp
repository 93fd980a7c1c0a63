#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tapbridge::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (handles \n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Raw text of a member of the top-level object, nested members are never matched.
[[nodiscard]] std::optional<std::string> json_get_raw(const std::string &json,
                                                      const std::string &field);

[[nodiscard]] bool json_has(const std::string &json, const std::string &field);

/// Extract a string member, empty when missing or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Like json_get_string but distinguishes a missing or non-string member.
[[nodiscard]] std::optional<std::string> json_get_optional_string(const std::string &json,
                                                                  const std::string &field);

/// Extract a numeric member as text.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);

/// Extract a nested object member (including braces).
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested array member (including brackets).
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Extract a string array member like ["a","b"].
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace tapbridge::common
