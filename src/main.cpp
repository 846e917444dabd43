#include "hooktunnel/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // Writes to a closed tunnel pipe must not kill the listener.
  std::signal(SIGPIPE, SIG_IGN);
  return hooktunnel::cli::run_cli(argc, argv);
}
