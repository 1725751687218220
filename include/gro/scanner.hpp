#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gro {

class Workspace; // fwd

struct ObservedSymlink {
  std::string workspace; // workspace name
  std::string relpath;   // '/'-separated, relative to the workspace root
  std::optional<std::filesystem::path> target; // resolved absolute target; nullopt if unreadable
  std::optional<std::filesystem::path> link_target; // link text made absolute, not followed
  bool dangling = false; // target missing or unresolvable

  // (category, link name) this symlink occupies
  [[nodiscard]] auto location() const -> std::pair<std::string, std::string>;
};

// Non-symlink entries a reconciliation must not overwrite
enum class EntryKind : std::uint8_t { File, EmptyDir, Dir, Clone, Symlink };

auto to_string(EntryKind kind) -> const char *;

struct WorkspaceSnapshot {
  std::string workspace;
  std::filesystem::path root;
  std::filesystem::path store; // canonical store path used for target comparison
  std::vector<ObservedSymlink> symlinks;  // sorted by relpath
  std::map<std::string, EntryKind> entries; // non-symlink entries by relpath
  std::map<std::string, std::filesystem::path> repo_targets; // store repo -> resolved directory

  [[nodiscard]] const ObservedSymlink *find_symlink(std::string_view relpath) const;
  [[nodiscard]] std::optional<EntryKind> entry_kind(std::string_view relpath) const;
  // Where a link to `repo` resolves: its resolved store directory, or <store>/<repo>
  [[nodiscard]] auto expected_target(const std::string &repo) const -> std::filesystem::path;
  // Repository directories living directly in the workspace, by relpath
  [[nodiscard]] auto clones() const -> std::vector<std::string>;
};

// Direct children of the store holding a ".git" marker, sorted. Missing store -> empty.
auto scan_store(const std::filesystem::path& store) -> std::vector<std::string>;

// Direct child directories of the store without a ".git" marker, sorted
auto scan_store_non_repos(const std::filesystem::path& store) -> std::vector<std::string>;

// Every symlink under the workspace (symlinks are leaves, plain directories are descended)
auto scan_workspace_symlinks(const Workspace& workspace) -> std::vector<ObservedSymlink>;

// Symlinks plus non-symlink entries. Missing workspace -> empty snapshot.
auto snapshot_workspace(const Workspace& workspace, const std::filesystem::path& store)
    -> WorkspaceSnapshot;

} // namespace gro
