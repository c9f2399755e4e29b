#include "exprune/cli/args.hpp"
#include "exprune/core/console.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  exprune::core::Console console;
  return exprune::cli::run_cli(args, console);
}
