#include "cli/options.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  gro::cli::register_all_commands(); // defined in register_commands.cpp

  const int first = gro::cli::parse_global_options(argc, argv);
  if (first < 0 || first >= argc) {
    gro::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[first];

  if (cmd == "help") {
    if (first + 1 >= argc) {
      gro::cli::print_usage();
      return 0;
    }
    if (const auto usage = gro::cli::usage_of(argv[first + 1])) {
      std::cout << "usage: " << *usage << "\n";
      return 0;
    }
    std::cerr << "unknown command: " << argv[first + 1] << "\n";
    return 2;
  }

  const auto fn = gro::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    gro::cli::print_usage();
    return 2;
  }
  // Pass the subcommand and everything after it to the handler
  return fn(argc - first, argv + first);
}
