#include "gro/config.hpp"
#include "gro/model.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static bool throws_config_error(std::string_view yaml, std::string_view needle) {
  try {
    (void)gro::parse_config(yaml);
  } catch (const gro::ConfigError &e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

int main() {
  const fs::path home =
      fs::temp_directory_path() / ("gro_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(home);
  ::setenv("HOME", home.c_str(), 1);

  try {
    const auto cfg = gro::parse_config("code: ~/src\n"
                                       "vscode_workspaces: ~/vscode\n"
                                       "Projects:\n"
                                       "  .: [repo-a, 'acme-git:git']\n"
                                       "  /tools/cli/: [govc]\n"
                                       "  empty:\n"
                                       "~/work/Client:\n"
                                       "  .: [repo-b]\n"
                                       "Scratch:\n");

    if (cfg.store != home / "src") {
      std::cerr << "store not expanded: " << cfg.store << "\n";
      return 1;
    }
    if (!cfg.vscode_workspaces || *cfg.vscode_workspaces != home / "vscode") {
      std::cerr << "vscode_workspaces not kept\n";
      return 1;
    }
    if (cfg.workspaces.size() != 3) {
      std::cerr << "expected 3 workspaces, got " << cfg.workspaces.size() << "\n";
      return 1;
    }
    const auto *projects = cfg.find_workspace("Projects");
    if (!projects || projects->path() != home / "Projects") {
      std::cerr << "simple key should map to ~/Projects\n";
      return 1;
    }
    const auto *root_cat = projects->find_category(".");
    if (!root_cat || root_cat->entries.size() != 2 ||
        root_cat->entries[1] != gro::RepoEntry{.repo_name = "acme-git", .alias = "git"}) {
      std::cerr << "root category entries wrong\n";
      return 1;
    }
    if (!projects->find_category("tools/cli") || !projects->find_category("empty") ||
        !projects->find_category("empty")->entries.empty()) {
      std::cerr << "category keys should be normalized, null categories kept empty\n";
      return 1;
    }
    const auto *client = cfg.find_workspace("Client");
    if (!client || client->path() != home / "work" / "Client") {
      std::cerr << "path key should be used as a path\n";
      return 1;
    }
    if (!cfg.find_workspace("Scratch") || !cfg.find_workspace("Scratch")->categories().empty()) {
      std::cerr << "null workspace should parse as empty\n";
      return 1;
    }

    // Default store
    if (gro::parse_config("W: {}\n").store != home / "code") {
      std::cerr << "store should default to ~/code\n";
      return 1;
    }

    // Rejections
    if (!throws_config_error("", "empty") ||
        !throws_config_error("- a\n- b\n", "mapping") ||
        !throws_config_error("workspaces:\n  - ~/x\n", "no longer supported") ||
        !throws_config_error("A: [x]\n", "must be a mapping") ||
        !throws_config_error("A:\n  .: repo\n", "must be a list") ||
        !throws_config_error("A:\n  .: [[x]]\n", "must be a string") ||
        !throws_config_error("Projects:\n~/other/Projects:\n", "basename collision") ||
        !throws_config_error("A: [unclosed\n", "invalid YAML") ||
        !throws_config_error("A:\n  .: ['', '..']\n", "invalid repo name") ||
        !throws_config_error("A:\n  .: ['repo-a:sub/name']\n", "invalid alias 'sub/name'") ||
        !throws_config_error("A:\n  ../up: [x]\n", "invalid category path")) {
      std::cerr << "invalid configs should raise ConfigError with a useful message\n";
      return 1;
    }

    // Save, reload and dump again: stable text, same model
    const fs::path path = home / ".config" / "gro" / "config.yaml";
    if (gro::default_config_path() != path) {
      std::cerr << "default config path wrong\n";
      return 1;
    }
    gro::save_config(cfg, path);
    const auto reloaded = gro::load_config(path);
    const auto text = gro::dump_config(cfg);
    if (gro::dump_config(reloaded) != text) {
      std::cerr << "dump is not stable across save/load:\n" << text << "\n";
      return 1;
    }
    if (text.find("code: ~/src") == std::string::npos ||
        text.find("~/work/Client:") == std::string::npos ||
        text.find("Projects:") == std::string::npos) {
      std::cerr << "dump should abbreviate home and use short workspace keys:\n" << text << "\n";
      return 1;
    }
    if (reloaded.workspaces.size() != 3 ||
        reloaded.find_workspace("Projects")->find_category(".")->entries.size() != 2) {
      std::cerr << "reloaded config lost entries\n";
      return 1;
    }

    try {
      (void)gro::load_config(home / "missing.yaml");
      std::cerr << "missing file should throw\n";
      return 1;
    } catch (const gro::ConfigError &) {
    }

    // Defaults
    {
      const auto def = gro::create_default_config();
      if (def.store != home / "code" || def.workspaces.size() != 1 ||
          def.workspaces[0].name() != "workspace") {
        std::cerr << "default config wrong\n";
        return 1;
      }
      bool threw = false;
      try {
        (void)gro::create_default_config(std::nullopt, {home / "a" / "X", home / "b" / "X"});
      } catch (const gro::ConfigError &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "duplicate workspace basenames should be rejected\n";
        return 1;
      }
    }

    // Validation findings
    {
      fs::create_directories(home / "src");
      auto v = gro::parse_config("code: ~/src\n"
                                 "Projects:\n"
                                 "  .: [foo, 'a:x', 'b:x']\n"
                                 "  foo/bar: [baz]\n"
                                 "  other: [foo]\n");
      const auto warnings = gro::validate_config(v);
      auto has = [&](std::string_view needle) {
        for (const auto &w : warnings)
          if (w.find(needle) != std::string::npos)
            return true;
        return false;
      };
      if (!has("workspace directory does not exist") || has("code directory does not exist") ||
          !has("repo 'foo' appears in multiple categories") ||
          !has("duplicate symlink name 'x'") ||
          !has("category path 'foo/bar' in workspace 'Projects' conflicts with repo 'foo'")) {
        std::cerr << "validate_config findings missing:\n";
        for (const auto &w : warnings)
          std::cerr << "  " << w << "\n";
        return 1;
      }
    }

    // Two store entries for one directory are reported
    {
      fs::create_directories(home / "real" / "shared" / ".git");
      fs::create_directory_symlink(home / "real" / "shared", home / "src" / "one");
      fs::create_directory_symlink(home / "real" / "shared", home / "src" / "two");
      const auto warnings = gro::validate_config(gro::parse_config("code: ~/src\n"));
      bool found = false;
      for (const auto &w : warnings)
        if (w.find("'one' and 'two' resolve to the same directory") != std::string::npos)
          found = true;
      if (!found) {
        std::cerr << "aliased store entries not reported\n";
        return 1;
      }
    }

    std::cout << "config_yaml OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(home);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(home, ec);
  return 0;
}
