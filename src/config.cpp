#include "gro/config.hpp"

#include "gro/consts.hpp"
#include "gro/fs.hpp"
#include "gro/scanner.hpp"
#include "gro/util.hpp"

#include <algorithm>
#include <map>
#include <yaml-cpp/yaml.h>

namespace {

// "Projects" -> ~/Projects; "~/x" and "/x" are taken as paths
std::filesystem::path key_to_workspace_path(const std::string &key) {
  if (key.starts_with('~') || key.starts_with('/'))
    return gro::expand_path(key);
  return gro::expand_path("~/" + key);
}

// Inverse of key_to_workspace_path: ~/Name -> "Name", deeper home paths keep "~/"
std::string workspace_key(const std::filesystem::path &ws_path) {
  const std::string shown = gro::abbreviate_home(ws_path);
  if (shown.starts_with("~/")) {
    const std::string rest = shown.substr(2);
    if (rest.find('/') == std::string::npos)
      return rest;
  }
  return shown;
}

std::string scalar(const YAML::Node &node, const std::string &what) {
  if (!node.IsScalar())
    throw gro::ConfigError(what + " must be a string");
  return node.as<std::string>();
}

} // namespace

namespace gro {

std::filesystem::path default_config_path() {
  return home_dir() / consts::kConfigDir / consts::kConfigFile;
}

Config load_config(const std::filesystem::path &path) {
  if (!fs::exists(path))
    throw ConfigError("config file not found: " + path.string());
  std::string text;
  try {
    const auto bytes = fs::read_file(path);
    text.assign(bytes.begin(), bytes.end());
  } catch (const std::runtime_error &e) {
    throw ConfigError(e.what());
  }
  return parse_config(text);
}

Config parse_config(std::string_view yaml_text) {
  YAML::Node loaded;
  try {
    loaded = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("invalid YAML in config file: ") + e.what());
  }
  const YAML::Node root = loaded;
  if (!root || root.IsNull())
    throw ConfigError("config file is empty");
  if (!root.IsMap())
    throw ConfigError("config must be a mapping of workspaces");

  if (root[std::string(consts::kKeyLegacyWorkspaces)])
    throw ConfigError("the 'workspaces' list is no longer supported; use top-level keys, e.g.\n"
                      "  code: ~/code\n"
                      "  Projects:\n"
                      "    .: [repo1, repo2]");

  Config cfg;
  cfg.store = expand_path(consts::kDefaultStore);

  // Reject two workspaces with the same basename
  std::map<std::string, std::string> basenames; // basename -> key
  for (const auto &kv : root) {
    const std::string key = scalar(kv.first, "config keys");
    if (key == consts::kKeyCode) {
      cfg.store = expand_path(scalar(kv.second, "'code'"));
      continue;
    }
    if (key == consts::kKeyVscode) {
      if (!kv.second.IsNull())
        cfg.vscode_workspaces = expand_path(scalar(kv.second, "'vscode_workspaces'"));
      continue;
    }

    Workspace ws{key_to_workspace_path(key)};
    const std::string name = ws.name();
    if (const auto it = basenames.find(name); it != basenames.end())
      throw ConfigError("workspace basename collision: '" + name + "' used by both '" +
                        it->second + "' and '" + key + "'");
    basenames.emplace(name, key);

    const YAML::Node body = kv.second;
    if (!body.IsNull() && !body.IsMap())
      throw ConfigError("workspace '" + key + "' config must be a mapping");

    if (body.IsMap()) {
      for (const auto &cat_kv : body) {
        const std::string cat_key = scalar(cat_kv.first, "category paths in '" + key + "'");
        if (const auto problem = category_problem(cat_key))
          throw ConfigError(*problem + " in workspace '" + key + "'");
        auto &cat = ws.get_or_create_category(cat_key);
        const YAML::Node repos = cat_kv.second;
        if (repos.IsNull())
          continue;
        if (!repos.IsSequence())
          throw ConfigError("category '" + cat_key + "' in workspace '" + key +
                            "' must be a list");
        const std::string where = "'" + key + "/" + cat_key + "'";
        for (const auto &item : repos) {
          auto entry = RepoEntry::parse(scalar(item, "repo names in " + where));
          if (const auto problem = entry.problem())
            throw ConfigError(*problem + " in " + where);
          cat.entries.push_back(std::move(entry));
        }
      }
    }
    cfg.workspaces.push_back(std::move(ws));
  }
  return cfg;
}

std::string dump_config(const Config &config) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << std::string(consts::kKeyCode) << YAML::Value
      << abbreviate_home(config.store);
  if (config.vscode_workspaces)
    out << YAML::Key << std::string(consts::kKeyVscode) << YAML::Value
        << abbreviate_home(*config.vscode_workspaces);

  for (const auto &ws : config.workspaces) {
    out << YAML::Key << workspace_key(ws.path()) << YAML::Value << YAML::BeginMap;
    for (const auto &[cat_path, cat] : ws.categories()) {
      std::vector<std::string> items;
      items.reserve(cat.entries.size());
      for (const auto &e : cat.entries)
        items.push_back(e.to_string());
      std::ranges::sort(items);
      out << YAML::Key << cat_path << YAML::Value << YAML::BeginSeq;
      for (const auto &s : items)
        out << s;
      out << YAML::EndSeq;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  if (!out.good())
    throw ConfigError("cannot render config: " + out.GetLastError());
  return std::string(out.c_str()) + "\n";
}

void save_config(const Config &config, const std::filesystem::path &path) {
  fs::write_text_atomic(path, dump_config(config));
}

Config create_default_config(const std::optional<std::filesystem::path> &store,
                             const std::vector<std::filesystem::path> &workspaces) {
  Config cfg;
  cfg.store = store ? expand_path(store->string()) : expand_path(consts::kDefaultStore);
  if (workspaces.empty()) {
    cfg.workspaces.emplace_back(expand_path(consts::kDefaultWorkspace));
  } else {
    for (const auto &p : workspaces) {
      Workspace ws{expand_path(p.string())};
      if (cfg.find_workspace(ws.name()))
        throw ConfigError("workspace basename collision: '" + ws.name() + "'");
      cfg.workspaces.push_back(std::move(ws));
    }
  }
  return cfg;
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!fs::exists(config.store))
    warnings.push_back("code directory does not exist: " + config.store.string());
  for (const auto &ws : config.workspaces)
    if (!fs::exists(ws.path()))
      warnings.push_back("workspace directory does not exist: " + ws.path().string());

  // Repos are identified by name; two names for one directory make links ambiguous
  std::map<std::filesystem::path, std::string> real_dirs;
  for (const auto &repo : scan_store(config.store)) {
    const auto real = fs::canonical_dir(config.store / repo);
    if (const auto [it, inserted] = real_dirs.emplace(real, repo); !inserted)
      warnings.push_back("code directory entries '" + it->second + "' and '" + repo +
                         "' resolve to the same directory: " + real.string());
  }

  for (const auto &ws : config.workspaces) {
    // A repo in several categories is allowed; mention it
    std::map<std::string, std::vector<std::string>> repo_locations;
    for (const auto &[cat_path, cat] : ws.categories())
      for (const auto &e : cat.entries)
        repo_locations[e.repo_name].push_back(cat_path);
    for (const auto &[repo, locations] : repo_locations)
      if (locations.size() > 1)
        warnings.push_back("repo '" + repo + "' appears in multiple categories in '" +
                           ws.name() + "': " + strutil::join(locations, ','));

    for (const auto &[cat_path, cat] : ws.categories()) {
      std::map<std::string, std::vector<std::string>> by_link;
      for (const auto &e : cat.entries)
        by_link[e.symlink_name()].push_back(e.repo_name);
      for (const auto &[link, repos] : by_link)
        if (repos.size() > 1)
          warnings.push_back("duplicate symlink name '" + link + "' in '" + ws.name() + "/" +
                             cat_path + "': repos " + strutil::join(repos, ','));
    }

    for (const auto &[cat_path, cat] : ws.categories()) {
      if (cat.is_root())
        continue;
      const auto parts = strutil::split(cat_path, consts::kCategorySep);
      for (std::size_t i = 0; i < parts.size(); ++i) {
        const std::string parent =
            i == 0 ? std::string(consts::kRootCategory)
                   : strutil::join(std::vector<std::string>(parts.begin(), parts.begin() + i),
                                   consts::kCategorySep);
        const auto *parent_cat = ws.find_category(parent);
        if (parent_cat && parent_cat->symlink_names().contains(parts[i])) {
          warnings.push_back("category path '" + cat_path + "' in workspace '" + ws.name() +
                             "' conflicts with repo '" + parts[i] + "' in category '" + parent +
                             "'");
          break;
        }
      }
    }
  }
  return warnings;
}

} // namespace gro
