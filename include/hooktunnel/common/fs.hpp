#pragma once

#include "hooktunnel/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace hooktunnel::common {

[[nodiscard]] std::string trim(const std::string &input);
/// Strip every trailing occurrence of any character in `chars`.
[[nodiscard]] std::string rtrim_chars(std::string value, const std::string &chars);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);

/// Cut `value` to at most `limit` bytes, then pad with `fill` up to `width`.
[[nodiscard]] std::string truncate_pad(const std::string &value, std::size_t limit,
                                       std::size_t width, char fill);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace hooktunnel::common
