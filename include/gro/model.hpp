#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gro {

struct RepoEntry {
  std::string repo_name;            // directory name under the store
  std::optional<std::string> alias; // link name when it differs from repo_name

  // Parse "repo" or "repo:alias" (split on the last ':').
  static auto parse(std::string_view text) -> RepoEntry;

  // Name of the symlink this entry produces inside its category
  [[nodiscard]] const std::string &symlink_name() const { return alias ? *alias : repo_name; }

  // Inverse of parse()
  [[nodiscard]] auto to_string() const -> std::string;

  // Why this entry cannot be placed, or nullopt. Both names must be a single
  // path component: not empty, not "." or "..", no '/'.
  [[nodiscard]] auto problem() const -> std::optional<std::string>;

  friend bool operator==(const RepoEntry &, const RepoEntry &) = default;
};

struct Category {
  std::string path; // normalized, "." for the workspace root
  std::vector<RepoEntry> entries;

  [[nodiscard]] bool is_root() const;
  [[nodiscard]] auto symlink_names() const -> std::set<std::string>;
  [[nodiscard]] bool contains(const RepoEntry &entry) const;
};

class Workspace {
public:
  explicit Workspace(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  // Basename of the workspace directory
  [[nodiscard]] auto name() const -> std::string;

  [[nodiscard]] const std::map<std::string, Category> &categories() const { return categories_; }

  // Lookup by (normalized) category path; nullptr if undeclared
  [[nodiscard]] const Category *find_category(std::string_view category_path) const;
  Category &get_or_create_category(std::string_view category_path);

  // Append an entry unless the category already holds it. Returns true if added.
  bool add_entry(std::string_view category_path, RepoEntry entry);

  [[nodiscard]] auto all_repos() const -> std::set<std::string>;
  // Categories containing repo_name, in category order
  [[nodiscard]] auto find_repo_categories(std::string_view repo_name) const
      -> std::vector<std::string>;

private:
  std::filesystem::path path_;
  std::map<std::string, Category> categories_;
};

struct Config {
  std::filesystem::path store;                                // the "code" directory
  std::vector<Workspace> workspaces;                          // declaration order
  std::optional<std::filesystem::path> vscode_workspaces;     // kept for round-tripping

  [[nodiscard]] const Workspace *find_workspace(std::string_view name) const;
  Workspace *find_workspace(std::string_view name);

  [[nodiscard]] auto all_repos() const -> std::set<std::string>;
  // (workspace name, category path) for every declaration of repo_name
  [[nodiscard]] auto find_repo_locations(std::string_view repo_name) const
      -> std::vector<std::pair<std::string, std::string>>;
};

// Why a category path cannot be used (a ".." segment would leave the workspace),
// or nullopt
auto category_problem(std::string_view raw) -> std::optional<std::string>;

// Strip leading/trailing '/', collapse empty and "." segments; "" -> "."
auto normalize_category_path(std::string_view raw) -> std::string;

// Workspace-relative path of a link: "name" at the root, "a/b/name" elsewhere
auto link_relpath(std::string_view category_path, std::string_view symlink_name) -> std::string;

// Split a workspace-relative link path back into (category, name)
auto split_link_relpath(std::string_view relpath) -> std::pair<std::string, std::string>;

} // namespace gro
