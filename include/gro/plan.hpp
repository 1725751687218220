#pragma once
#include "gro/scanner.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gro {

// Actions: one filesystem mutation each

struct CreateAction {
  std::string category;
  std::string symlink_name;
  std::string repo_name;
};

struct RelinkAction {
  std::string category;
  std::string symlink_name;
  std::string repo_name;
  std::filesystem::path old_target; // empty if the old link was unreadable
  std::filesystem::path new_target;
};

struct RemoveAction {
  std::string category;
  std::string symlink_name;
};

using Action = std::variant<CreateAction, RelinkAction, RemoveAction>;

// Conflicts: block the affected paths

// Two entries in one category resolve to the same link name
struct NameCollision {
  std::string category;
  std::string symlink_name;
  std::vector<std::string> repos;
};

// A non-symlink entry sits where a link (or one of its parent directories) must go
struct PathObstruction {
  std::string path;    // obstructing entry, workspace-relative
  EntryKind kind;
  std::string blocked; // link that cannot be placed
};

// A category directory and a link share one filesystem location
struct CategoryRepoCollision {
  std::string category;        // declared category, e.g. "foo/bar"
  std::string parent_category; // category declaring the link, e.g. "."
  std::string symlink_name;    // e.g. "foo"
};

using Conflict = std::variant<NameCollision, PathObstruction, CategoryRepoCollision>;

struct Plan {
  std::string workspace;
  std::vector<Action> actions; // sorted by (category, symlink_name)
  std::vector<Conflict> conflicts;
  std::vector<std::string> warnings;
  std::vector<std::string> orphans; // undeclared links left in place (no prune)

  [[nodiscard]] bool empty() const { return actions.empty(); }
  [[nodiscard]] bool has_blocking_conflicts() const { return !conflicts.empty(); }
};

// (category, symlink_name) an action touches
auto action_location(const Action& action) -> std::pair<std::string, std::string>;

// Workspace-relative path an action touches
auto action_relpath(const Action& action) -> std::string;

// One-line human renderings, e.g. "+ tools/govc -> govc"
auto describe(const Action& action) -> std::string;
auto describe(const Conflict& conflict) -> std::string;

// "ws/name" for the root category, "ws/cat/name" otherwise
auto display_path(std::string_view workspace, std::string_view category,
                  std::string_view symlink_name) -> std::string;

} // namespace gro
