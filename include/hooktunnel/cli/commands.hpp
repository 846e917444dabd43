#pragma once

#include "hooktunnel/lifecycle/context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hooktunnel::cli {

/// `listen` arguments after the subcommand. `service` is left empty when not given.
[[nodiscard]] std::optional<lifecycle::ListenOptions>
parse_listen_args(std::vector<std::string> args, std::string &error);

void print_help();
[[nodiscard]] std::string version_string();

int run_cli(int argc, char **argv);

} // namespace hooktunnel::cli
