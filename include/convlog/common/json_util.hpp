#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace convlog::common {

/// Escape a string for embedding inside a JSON string literal (JSON.stringify rules).
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Strictly scan one JSON value starting at pos. Returns one past its end, or npos.
[[nodiscard]] std::size_t json_scan_value(const std::string &text, std::size_t pos);

/// True when text holds exactly one well-formed JSON value (surrounding whitespace allowed).
[[nodiscard]] bool json_is_valid(const std::string &text);

/// Drop whitespace outside string literals. The input must already be valid JSON.
[[nodiscard]] std::string json_compact(const std::string &json);

/// Ordered top-level members of an object: unescaped key, raw value text.
using JsonMembers = std::vector<std::pair<std::string, std::string>>;

/// Split a well-formed JSON object into its members. Fails on any syntax error.
[[nodiscard]] std::optional<JsonMembers> json_object_members(const std::string &json);

/// Elements of a well-formed JSON array as raw value text.
[[nodiscard]] std::optional<std::vector<std::string>> json_array_elements(const std::string &json);

/// Decode a raw string token ("..."). Fails if the raw value is not a string.
[[nodiscard]] std::optional<std::string> json_string_value(const std::string &raw);

/// Raw value of a member, if present.
[[nodiscard]] const std::string *json_find_member(const JsonMembers &members,
                                                  const std::string &key);

} // namespace convlog::common
