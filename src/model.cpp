#include "gro/model.hpp"

#include "gro/consts.hpp"
#include "gro/util.hpp"

#include <algorithm>

namespace gro {

RepoEntry RepoEntry::parse(std::string_view text) {
  const std::string s = strutil::trim(text);
  const auto pos = s.rfind(consts::kAliasSep);
  if (pos == std::string::npos || pos == 0)
    return RepoEntry{.repo_name = s, .alias = std::nullopt};
  if (pos + 1 == s.size()) // "repo:" carries no alias
    return RepoEntry{.repo_name = s.substr(0, pos), .alias = std::nullopt};

  RepoEntry e{.repo_name = s.substr(0, pos), .alias = s.substr(pos + 1)};
  if (*e.alias == e.repo_name)
    e.alias.reset();
  return e;
}

std::string RepoEntry::to_string() const {
  if (!alias)
    return repo_name;
  return repo_name + consts::kAliasSep + *alias;
}

static bool is_single_component(std::string_view name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find(consts::kCategorySep) == std::string_view::npos;
}

std::optional<std::string> RepoEntry::problem() const {
  if (!is_single_component(repo_name))
    return "invalid repo name '" + repo_name + "'";
  if (alias && !is_single_component(*alias))
    return "invalid alias '" + *alias + "' for repo '" + repo_name + "'";
  return std::nullopt;
}

bool Category::is_root() const { return path == consts::kRootCategory; }

std::set<std::string> Category::symlink_names() const {
  std::set<std::string> out;
  for (const auto &e : entries)
    out.insert(e.symlink_name());
  return out;
}

bool Category::contains(const RepoEntry &entry) const {
  return std::ranges::find(entries, entry) != entries.end();
}

Workspace::Workspace(std::filesystem::path path) : path_(std::move(path)) {}

std::string Workspace::name() const {
  auto p = path_;
  if (!p.has_filename())
    p = p.parent_path(); // trailing separator
  return p.filename().string();
}

const Category *Workspace::find_category(std::string_view category_path) const {
  const auto it = categories_.find(normalize_category_path(category_path));
  return it == categories_.end() ? nullptr : &it->second;
}

Category &Workspace::get_or_create_category(std::string_view category_path) {
  auto key = normalize_category_path(category_path);
  auto [it, inserted] = categories_.try_emplace(key);
  if (inserted)
    it->second.path = std::move(key);
  return it->second;
}

bool Workspace::add_entry(std::string_view category_path, RepoEntry entry) {
  auto &cat = get_or_create_category(category_path);
  if (cat.contains(entry))
    return false;
  cat.entries.push_back(std::move(entry));
  return true;
}

std::set<std::string> Workspace::all_repos() const {
  std::set<std::string> out;
  for (const auto &[_, cat] : categories_)
    for (const auto &e : cat.entries)
      out.insert(e.repo_name);
  return out;
}

std::vector<std::string> Workspace::find_repo_categories(std::string_view repo_name) const {
  std::vector<std::string> out;
  for (const auto &[path, cat] : categories_) {
    if (std::ranges::any_of(cat.entries, [&](const RepoEntry &e) { return e.repo_name == repo_name; }))
      out.push_back(path);
  }
  return out;
}

const Workspace *Config::find_workspace(std::string_view name) const {
  const auto it = std::ranges::find_if(workspaces, [&](const Workspace &w) { return w.name() == name; });
  return it == workspaces.end() ? nullptr : &*it;
}

Workspace *Config::find_workspace(std::string_view name) {
  const auto it = std::ranges::find_if(workspaces, [&](const Workspace &w) { return w.name() == name; });
  return it == workspaces.end() ? nullptr : &*it;
}

std::set<std::string> Config::all_repos() const {
  std::set<std::string> out;
  for (const auto &ws : workspaces)
    out.merge(ws.all_repos());
  return out;
}

std::vector<std::pair<std::string, std::string>>
Config::find_repo_locations(std::string_view repo_name) const {
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto &ws : workspaces)
    for (auto &cat : ws.find_repo_categories(repo_name))
      out.emplace_back(ws.name(), std::move(cat));
  return out;
}

std::string normalize_category_path(std::string_view raw) {
  std::vector<std::string> parts;
  for (auto &seg : strutil::split(strutil::trim(raw), consts::kCategorySep)) {
    if (seg.empty() || seg == consts::kRootCategory)
      continue;
    parts.push_back(std::move(seg));
  }
  if (parts.empty())
    return std::string(consts::kRootCategory);
  return strutil::join(parts, consts::kCategorySep);
}

std::optional<std::string> category_problem(std::string_view raw) {
  for (const auto &seg : strutil::split(strutil::trim(raw), consts::kCategorySep))
    if (seg == "..")
      return "invalid category path '" + std::string(raw) + "'";
  return std::nullopt;
}

std::string link_relpath(std::string_view category_path, std::string_view symlink_name) {
  if (category_path == consts::kRootCategory)
    return std::string(symlink_name);
  std::string out(category_path);
  out += consts::kCategorySep;
  out += symlink_name;
  return out;
}

std::pair<std::string, std::string> split_link_relpath(std::string_view relpath) {
  const auto pos = relpath.rfind(consts::kCategorySep);
  if (pos == std::string_view::npos)
    return {std::string(consts::kRootCategory), std::string(relpath)};
  return {std::string(relpath.substr(0, pos)), std::string(relpath.substr(pos + 1))};
}

} // namespace gro
