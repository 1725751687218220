#include "cli/options.hpp"

#include "gro/config.hpp"
#include "gro/fs.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

namespace gro::cli {

GlobalOptions &options() {
  static GlobalOptions o;
  return o;
}

int parse_global_options(int argc, char **argv) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.empty() || arg[0] != '-')
      break;
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return -1;
      }
      options().config_path = argv[++i];
    } else if (arg == "-n" || arg == "--dry-run") {
      options().dry_run = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options().verbose = true;
    } else {
      std::cerr << "unknown option: " << arg << "\n";
      return -1;
    }
  }
  spdlog::set_level(options().verbose ? spdlog::level::debug : spdlog::level::warn);
  return i;
}

std::filesystem::path config_path() {
  return options().config_path ? *options().config_path : default_config_path();
}

std::optional<Config> load_config_or_report(const char *cmd) {
  const auto path = config_path();
  if (!fs::exists(path)) {
    std::cerr << cmd << ": config not found: " << path.string() << "\n";
    std::cerr << "Run 'gro init' to create a config file.\n";
    return std::nullopt;
  }
  try {
    return load_config(path);
  } catch (const std::exception &e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

std::optional<std::vector<Workspace *>> select_workspaces(Config &config, const std::string &name,
                                                          const char *cmd) {
  std::vector<Workspace *> out;
  if (name.empty()) {
    for (auto &ws : config.workspaces)
      out.push_back(&ws);
    return out;
  }
  auto *ws = config.find_workspace(name);
  if (!ws) {
    std::cerr << cmd << ": unknown workspace: " << name << "\n";
    return std::nullopt;
  }
  out.push_back(ws);
  return out;
}

} // namespace gro::cli
