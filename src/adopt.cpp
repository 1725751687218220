#include "gro/adopt.hpp"

#include "gro/fs.hpp"

#include <spdlog/spdlog.h>

namespace gro {

Adoption adopt_symlinks(const std::vector<ObservedSymlink> &links,
                        const std::filesystem::path &store) {
  Adoption out;
  const auto store_dir = fs::canonical_dir(store);

  for (const auto &link : links) {
    const auto [category, name] = link.location();
    if (link.dangling || !link.target) {
      out.warnings.push_back("Skipping " + link.relpath + " (broken symlink)");
      continue;
    }
    // A link written through the store names the repo even when the store entry is
    // itself a symlink; otherwise fall back to where it resolves.
    const auto &target = (link.link_target && link.link_target->parent_path() == store_dir)
                             ? *link.link_target
                             : *link.target;
    if (target.parent_path() != store_dir) {
      out.warnings.push_back("Skipping " + link.relpath + " -> " + target.string() +
                             " (not in code directory)");
      continue;
    }

    RepoEntry entry{.repo_name = target.filename().string(), .alias = std::nullopt};
    if (name != entry.repo_name)
      entry.alias = name;
    out.entries.emplace_back(category, std::move(entry));
  }
  return out;
}

Adoption adopt_workspace(const Workspace &workspace, const std::filesystem::path &store) {
  return adopt_symlinks(scan_workspace_symlinks(workspace), store);
}

std::size_t merge_adopted(Workspace &workspace, const Adoption &adoption) {
  std::size_t added = 0;
  for (const auto &[category, entry] : adoption.entries) {
    const auto *cat = workspace.find_category(category);
    if (cat && cat->symlink_names().contains(entry.symlink_name())) {
      spdlog::debug("adopt: {} already declared in {}", entry.symlink_name(), category);
      continue;
    }
    if (workspace.add_entry(category, entry))
      ++added;
  }
  return added;
}

} // namespace gro
