#include <iostream>
#include <unistd.h>

#include "cli_utils.h"
#include "config.h"

int main(int argc, char** argv) {
  using namespace recolor::cli;

  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  CliStreams io{std::cin, std::cout, std::cerr, isatty(STDERR_FILENO) != 0};
  return run_cli(argc, argv, io, load_env_settings());
}
