#pragma once

#include "hooktunnel/common/result.hpp"
#include "hooktunnel/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hooktunnel::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the config file (if any), then layers `.env` and process environment on top.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

void apply_env_overrides(Config &config);

/// One message per missing required field; empty when the config is usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

/// Local route the tunnel forwards to: `local_url/path/webhook`.
[[nodiscard]] std::string local_webhook_route(const Config &config);

} // namespace hooktunnel::config
