#include "gro/reconcile.hpp"

#include "gro/consts.hpp"
#include "gro/model.hpp"
#include "gro/util.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <spdlog/spdlog.h>

namespace gro {

using Location = std::pair<std::string, std::string>; // (category, symlink name)

// Directories a category occupies: "a/b/c" -> {"a", "a/b", "a/b/c"}; root -> {}
static std::vector<std::string> category_dirs(const std::string &category) {
  std::vector<std::string> out;
  if (category == consts::kRootCategory)
    return out;
  std::string acc;
  for (const auto &seg : strutil::split(category, consts::kCategorySep)) {
    if (!acc.empty())
      acc += consts::kCategorySep;
    acc += seg;
    out.push_back(acc);
  }
  return out;
}

// First parent directory of `rel` that cannot hold a category directory.
// Symlinks the plan is about to remove do not count.
static std::optional<PathObstruction>
find_ancestor_obstruction(const WorkspaceSnapshot &snapshot, const std::string &category,
                          const std::string &rel, const std::set<std::string> &removed) {
  for (const auto &dir : category_dirs(category)) {
    const auto kind = snapshot.entry_kind(dir);
    if (!kind || *kind == EntryKind::Dir || *kind == EntryKind::EmptyDir)
      continue;
    if (*kind == EntryKind::Symlink && removed.contains(dir))
      continue;
    return PathObstruction{.path = dir, .kind = *kind, .blocked = rel};
  }
  return std::nullopt;
}

Plan reconcile(const Workspace &workspace, const WorkspaceSnapshot &snapshot,
               const std::set<std::string> &store_repos, const ReconcileOptions &options) {
  Plan plan;
  plan.workspace = workspace.name();
  const std::string &ws = plan.workspace;

  // 1) Flatten the category tree; ambiguous link names abandon their category
  std::map<Location, std::vector<std::string>> declared; // repos in declaration order
  for (const auto &[cat_path, cat] : workspace.categories())
    for (const auto &e : cat.entries)
      declared[Location{cat_path, e.symlink_name()}].push_back(e.repo_name);

  std::set<std::string> collided;
  std::map<Location, std::string> targets;
  for (const auto &[loc, repos] : declared) {
    std::vector<std::string> distinct;
    for (const auto &r : repos)
      if (std::ranges::find(distinct, r) == distinct.end())
        distinct.push_back(r);
    if (distinct.size() > 1) {
      plan.conflicts.emplace_back(
          NameCollision{.category = loc.first, .symlink_name = loc.second, .repos = distinct});
      collided.insert(loc.first);
      continue;
    }
    if (repos.size() > 1)
      plan.warnings.push_back("duplicate entry '" + repos.front() + "' in " +
                              display_path(ws, loc.first, loc.second));
    targets.emplace(loc, distinct.front());
  }

  // 2) A category directory cannot share its location with a declared link
  std::set<Location> blocked;
  std::set<std::string> blocked_categories;
  for (const auto &[cat_path, cat] : workspace.categories()) {
    if (cat.entries.empty() || cat.is_root())
      continue;
    const auto dirs = category_dirs(cat_path);
    for (std::size_t i = 0; i < dirs.size(); ++i) {
      const std::string parent = i == 0 ? std::string(consts::kRootCategory) : dirs[i - 1];
      const std::string component = split_link_relpath(dirs[i]).second;
      const Location loc{parent, component};
      if (!declared.contains(loc))
        continue;
      plan.conflicts.emplace_back(CategoryRepoCollision{
          .category = cat_path, .parent_category = parent, .symlink_name = component});
      blocked.insert(loc);
      blocked_categories.insert(cat_path);
      break; // first conflicting segment only
    }
  }

  std::erase_if(targets, [&](const auto &kv) {
    return collided.contains(kv.first.first) || blocked.contains(kv.first) ||
           blocked_categories.contains(kv.first.first);
  });

  // 3) Undeclared links: Remove under prune, otherwise leave them and report
  std::set<std::string> removed;
  for (const auto &link : snapshot.symlinks) {
    const auto loc = link.location();
    if (declared.contains(loc) || collided.contains(loc.first))
      continue;
    if (options.prune) {
      plan.actions.emplace_back(RemoveAction{.category = loc.first, .symlink_name = loc.second});
      removed.insert(link.relpath);
    } else {
      plan.orphans.push_back(link.relpath);
      plan.warnings.push_back("orphaned symlink '" + display_path(ws, loc.first, loc.second) +
                              "' (not in config" + (link.dangling ? ", broken)" : ")"));
    }
  }

  // 4) Declared links: Create, Relink or already satisfied
  for (const auto &[loc, repo] : targets) {
    const auto &[category, name] = loc;
    const std::string rel = link_relpath(category, name);

    if (auto obstruction = find_ancestor_obstruction(snapshot, category, rel, removed)) {
      plan.conflicts.emplace_back(std::move(*obstruction));
      continue;
    }

    const auto expected = snapshot.expected_target(repo);
    if (const auto *link = snapshot.find_symlink(rel)) {
      if (link->target && *link->target == expected)
        continue;
      plan.actions.emplace_back(RelinkAction{.category = category,
                                             .symlink_name = name,
                                             .repo_name = repo,
                                             .old_target = link->target.value_or(
                                                 std::filesystem::path{}),
                                             .new_target = expected});
    } else {
      // Never overwrite non-symlink content; an empty directory may be replaced
      if (const auto kind = snapshot.entry_kind(rel); kind && *kind != EntryKind::EmptyDir) {
        plan.conflicts.emplace_back(PathObstruction{.path = rel, .kind = *kind, .blocked = rel});
        continue;
      }
      plan.actions.emplace_back(
          CreateAction{.category = category, .symlink_name = name, .repo_name = repo});
    }

    if (!store_repos.contains(repo))
      plan.warnings.push_back("repo '" + repo + "' not found in store; " +
                              display_path(ws, category, name) + " will be dangling");
  }

  std::ranges::stable_sort(plan.actions, {}, [](const Action &a) { return action_location(a); });

  spdlog::debug("reconcile {}: {} actions, {} conflicts, {} warnings", ws, plan.actions.size(),
                plan.conflicts.size(), plan.warnings.size());
  return plan;
}

Plan reconcile_workspace(const Config &config, const Workspace &workspace,
                         const ReconcileOptions &options) {
  const auto snapshot = snapshot_workspace(workspace, config.store);
  const auto repos = scan_store(config.store);
  return reconcile(workspace, snapshot, std::set<std::string>(repos.begin(), repos.end()),
                   options);
}

} // namespace gro
