#pragma once
#include "gro/model.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gro {

// Invalid, missing or unreadable configuration
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ~/.config/gro/config.yaml
auto default_config_path() -> std::filesystem::path;

// Load and parse a YAML config file. Throws ConfigError.
auto load_config(const std::filesystem::path& path) -> Config;

// Parse YAML text:
//   code: ~/code                # the store, defaults to ~/code
//   Projects:                   # any other key is a workspace (~/Projects)
//     .: [repo-a, acme-git:git]
//     tools/cli: [govc]
auto parse_config(std::string_view yaml_text) -> Config;

// Canonical YAML rendering: categories and entries sorted, home abbreviated to "~"
auto dump_config(const Config& config) -> std::string;

// Write dump_config(config) to path, atomically
void save_config(const Config& config, const std::filesystem::path& path);

// Store defaults to ~/code, workspaces to {~/workspace}
auto create_default_config(const std::optional<std::filesystem::path>& store = std::nullopt,
                           const std::vector<std::filesystem::path>& workspaces = {}) -> Config;

// Non-fatal findings: missing directories, repos declared in several categories,
// duplicate link names, category paths colliding with links.
auto validate_config(const Config& config) -> std::vector<std::string>;

} // namespace gro
