#include "hooktunnel/cli/commands.hpp"

#include "hooktunnel/cli/console.hpp"
#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/config/config.hpp"
#include "hooktunnel/http/client.hpp"
#include "hooktunnel/lifecycle/cancellation.hpp"
#include "hooktunnel/lifecycle/controller.hpp"
#include "hooktunnel/observability/factory.hpp"
#include "hooktunnel/observability/global.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace hooktunnel::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// 1 when taken, 0 when absent, -1 when the value is missing.
int take_option(std::vector<std::string> &args, const std::string &long_name,
                std::string &out_value) {
  const std::string inline_prefix = long_name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return -1;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return 1;
    }
    if (common::starts_with(args[i], inline_prefix)) {
      out_value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return 1;
    }
  }
  return 0;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = "") {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  std::string path;
  const int taken = take_option(args, "--config", path);
  if (taken < 0 || (taken > 0 && path.empty())) {
    error = "missing value for --config";
    return false;
  }
  if (taken > 0) {
    config::set_config_path_override(common::expand_path(path));
  }
  return true;
}

bool stdin_is_terminal() { return isatty(fileno(stdin)) != 0; }

int run_listen(std::vector<std::string> args) {
  std::string parse_error;
  auto options = parse_listen_args(std::move(args), parse_error);
  if (!options.has_value()) {
    std::cerr << parse_error << "\n";
    std::cerr << "usage: hooktunnel listen <expose|ngrok|custom|test> [--url URL] [--cleanup] "
                 "[--isolated] [-v]\n";
    return 1;
  }

  if (options->service.empty() && stdin_is_terminal()) {
    options->service =
        prompt_choice(std::cin, std::cout, "Please choose a service",
                      {"expose", "ngrok", "custom"}, "expose");
  }

  auto config = config::load_config();
  if (!config.ok()) {
    std::cerr << "config error: " << config.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(config.value()));

  TerminalConsole console;
  http::CurlHttpClient transport;
  lifecycle::CancellationFlag cancel;
  lifecycle::LifecycleController controller(config.value(), console, transport, cancel);
  return controller.run(*options);
}

} // namespace

std::optional<lifecycle::ListenOptions> parse_listen_args(std::vector<std::string> args,
                                                          std::string &error) {
  lifecycle::ListenOptions options;

  std::string url;
  const int url_taken = take_option(args, "--url", url);
  if (url_taken < 0) {
    error = "missing value for --url";
    return std::nullopt;
  }
  if (url_taken > 0) {
    options.url = url;
  }
  options.cleanup = take_flag(args, "--cleanup");
  options.isolated = take_flag(args, "--isolated");
  options.verbose = take_flag(args, "--verbose", "-v");

  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      error = "unknown option: " + arg;
      return std::nullopt;
    }
  }
  if (args.size() > 1) {
    error = "unexpected argument: " + args[1];
    return std::nullopt;
  }
  if (!args.empty()) {
    options.service = args[0];
  }
  return options;
}

std::string version_string() {
#ifdef HOOKTUNNEL_VERSION
  std::string version = HOOKTUNNEL_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "hooktunnel " + version;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  hooktunnel" << RESET << DIM
            << "  Receive Lemon Squeezy webhooks on your local machine." << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "hooktunnel [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "listen" << RESET << " SERVICE" << DIM
            << "   Tunnel webhooks via expose, ngrok or a custom URL" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET
            << "\n\n";

  std::cout << BOLD << "  LISTEN OPTIONS" << RESET << "\n";
  std::cout << "  " << GREEN << "--url URL" << RESET << DIM
            << "        Public URL to register (custom service)" << RESET << "\n";
  std::cout << "  " << GREEN << "--cleanup" << RESET << DIM
            << "        Remove every webhook pointing at the service's domain" << RESET << "\n";
  std::cout << "  " << GREEN << "--isolated" << RESET << DIM
            << "       Refuse to run next to another listener" << RESET << "\n";
  std::cout << "  " << GREEN << "-v, --verbose" << RESET << DIM
            << "    Echo tunnel output" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "listen") {
    return run_listen(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace hooktunnel::cli
