#include "gro/scanner.hpp"

#include "gro/fs.hpp"
#include "gro/model.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stack>

namespace gro {

std::pair<std::string, std::string> ObservedSymlink::location() const {
  return split_link_relpath(relpath);
}

const char *to_string(EntryKind kind) {
  switch (kind) {
  case EntryKind::File:
    return "file";
  case EntryKind::EmptyDir:
    return "empty directory";
  case EntryKind::Dir:
    return "directory";
  case EntryKind::Clone:
    return "repository clone";
  case EntryKind::Symlink:
    return "symlink";
  }
  return "entry";
}

const ObservedSymlink *WorkspaceSnapshot::find_symlink(std::string_view relpath) const {
  const auto it = std::lower_bound(
      symlinks.begin(), symlinks.end(), relpath,
      [](const ObservedSymlink &s, std::string_view v) { return std::string_view(s.relpath) < v; });
  return (it != symlinks.end() && it->relpath == relpath) ? &*it : nullptr;
}

std::optional<EntryKind> WorkspaceSnapshot::entry_kind(std::string_view relpath) const {
  if (find_symlink(relpath))
    return EntryKind::Symlink;
  const auto it = entries.find(std::string(relpath));
  if (it == entries.end())
    return std::nullopt;
  return it->second;
}

std::filesystem::path WorkspaceSnapshot::expected_target(const std::string &repo) const {
  if (const auto it = repo_targets.find(repo); it != repo_targets.end())
    return it->second;
  return (store / repo).lexically_normal();
}

std::vector<std::string> WorkspaceSnapshot::clones() const {
  std::vector<std::string> out;
  for (const auto &[rel, kind] : entries)
    if (kind == EntryKind::Clone)
      out.push_back(rel);
  return out;
}

static std::vector<std::string> list_store(const std::filesystem::path &store, bool repos) {
  std::vector<std::string> out;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(store, ec), end; !ec && it != end;
       it.increment(ec)) {
    // Repos may be symlinked into the store; non-repos are only plain directories
    const auto &p = it->path();
    std::error_code st_ec;
    if (repos) {
      if (it->is_directory(st_ec) && fs::has_repo_marker(p))
        out.push_back(p.filename().string());
    } else if (fs::is_plain_dir(p) && !fs::has_repo_marker(p)) {
      out.push_back(p.filename().string());
    }
  }
  if (ec)
    spdlog::debug("scan: listing {} stopped: {}", store.string(), ec.message());
  std::ranges::sort(out);
  return out;
}

std::vector<std::string> scan_store(const std::filesystem::path &store) {
  return list_store(store, true);
}

std::vector<std::string> scan_store_non_repos(const std::filesystem::path &store) {
  return list_store(store, false);
}

// Walk the workspace with an explicit worklist of (directory, category prefix).
static void walk_workspace(const std::filesystem::path &root, const std::string &ws_name,
                           WorkspaceSnapshot &out) {
  std::stack<std::pair<std::filesystem::path, std::string>> work;
  work.emplace(root, "");

  while (!work.empty()) {
    auto [dir, prefix] = std::move(work.top());
    work.pop();

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
      spdlog::debug("scan: cannot list {}: {}", dir.string(), ec.message());
      continue;
    }
    for (const std::filesystem::directory_iterator end; !ec && it != end;
         it.increment(ec)) {
      const auto &p = it->path();
      const std::string name = p.filename().string();
      std::string rel = prefix.empty() ? name : prefix + "/" + name;

      std::error_code st_ec;
      const auto st = it->symlink_status(st_ec);
      if (st_ec)
        continue; // vanished between listing and stat
      if (std::filesystem::is_symlink(st)) {
        ObservedSymlink link{.workspace = ws_name, .relpath = std::move(rel)};
        link.target = fs::resolve_link(p);
        link.link_target = fs::link_destination(p);
        link.dangling = !link.target || !fs::exists(p);
        out.symlinks.push_back(std::move(link));
      } else if (std::filesystem::is_directory(st)) {
        if (fs::has_repo_marker(p)) {
          out.entries.emplace(std::move(rel), EntryKind::Clone);
          continue;
        }
        const bool empty = std::filesystem::is_empty(p, st_ec);
        out.entries.emplace(rel, (!st_ec && empty) ? EntryKind::EmptyDir : EntryKind::Dir);
        work.emplace(p, std::move(rel));
      } else {
        out.entries.emplace(std::move(rel), EntryKind::File);
      }
    }
    if (ec)
      spdlog::debug("scan: listing {} stopped: {}", dir.string(), ec.message());
  }

  std::ranges::sort(out.symlinks, {}, &ObservedSymlink::relpath);
}

std::vector<ObservedSymlink> scan_workspace_symlinks(const Workspace &workspace) {
  WorkspaceSnapshot snap;
  if (fs::exists(workspace.path()))
    walk_workspace(workspace.path(), workspace.name(), snap);
  return std::move(snap.symlinks);
}

WorkspaceSnapshot snapshot_workspace(const Workspace &workspace,
                                     const std::filesystem::path &store) {
  WorkspaceSnapshot snap;
  snap.workspace = workspace.name();
  snap.root = workspace.path();
  snap.store = fs::canonical_dir(store);
  for (const auto &repo : scan_store(store))
    snap.repo_targets.emplace(repo, fs::canonical_dir(snap.store / repo));
  if (fs::exists(workspace.path()))
    walk_workspace(workspace.path(), snap.workspace, snap);
  spdlog::debug("scan: {} symlinks, {} other entries in {}", snap.symlinks.size(),
                snap.entries.size(), workspace.path().string());
  return snap;
}

} // namespace gro
