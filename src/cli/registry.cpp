#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>

namespace gro::cli {

static std::map<std::string, CommandInfo> &table() {
  static std::map<std::string, CommandInfo> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &synopsis,
                      const std::string &summary) {
  table()[name] = CommandInfo{.fn = fn, .synopsis = synopsis, .summary = summary};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

std::optional<std::string> usage_of(const std::string &name) {
  const auto it = table().find(name);
  if (it == table().end())
    return std::nullopt;
  return "gro " + (it->second.synopsis.empty() ? name : name + " " + it->second.synopsis);
}

void print_usage() {
  std::cerr << "usage: gro [-c <config>] [-n|--dry-run] [-v] <command> [args]\n\n";
  std::cerr << "commands:\n";
  std::size_t width = 0;
  for (const auto &[name, info] : table())
    width = std::max(width, name.size());
  for (const auto &[name, info] : table())
    std::cerr << "  " << name << std::string(width - name.size() + 2, ' ') << info.summary
              << "\n";
  std::cerr << "\nrun 'gro help <command>' for its arguments\n";
}

int usage_error(const std::string &name) {
  if (const auto u = usage_of(name))
    std::cerr << "usage: " << *u << "\n";
  else
    print_usage();
  return 2;
}

} // namespace gro::cli
