#pragma once
#include "cli/command.hpp"

#include <optional>
#include <string>

namespace gro::cli {

// One subcommand: its handler, its argument synopsis ("apply [--prune] [-w <workspace>]")
// and a one-line summary for the command list.
struct CommandInfo {
  command_fn fn = nullptr;
  std::string synopsis;
  std::string summary;
};

void register_command(const std::string& name, command_fn fn, const std::string& synopsis,
                      const std::string& summary);
command_fn find_command(const std::string& name);
auto usage_of(const std::string& name) -> std::optional<std::string>;

// Global usage plus every command with its summary
void print_usage();

// Print "usage: gro <synopsis>" for `name` and return the usage-error exit code
int usage_error(const std::string& name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gro::cli
