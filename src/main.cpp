#include "tapbridge/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // A daemon closing its socket mid-write must surface as a send error.
  std::signal(SIGPIPE, SIG_IGN);
  return tapbridge::cli::run_cli(argc, argv);
}
