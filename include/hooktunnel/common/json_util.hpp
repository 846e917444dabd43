#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hooktunnel::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal (without the surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Index one past the JSON value that starts at `pos`, or npos when malformed.
[[nodiscard]] std::size_t json_value_end(const std::string &json, std::size_t pos);

/// Top-level members of a JSON object, raw value text keyed by member name.
using JsonMembers = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonMembers json_object_members(const std::string &object_json);

/// Raw text of member `key` of a JSON object; empty when absent.
[[nodiscard]] std::string json_member(const std::string &object_json, const std::string &key);

/// Follow dotted member names through nested objects ("meta.page.lastPage").
[[nodiscard]] std::string json_path(const std::string &json, const std::string &dotted);

/// Raw texts of the elements of a JSON array.
[[nodiscard]] std::vector<std::string> json_array_elements(const std::string &array_json);

/// Strings decoded, numbers and booleans verbatim, anything else empty.
[[nodiscard]] std::string json_scalar(const std::string &raw);

[[nodiscard]] std::optional<long long> json_integer(const std::string &raw);

[[nodiscard]] std::vector<std::string> json_string_array(const std::string &array_json);

} // namespace hooktunnel::common
