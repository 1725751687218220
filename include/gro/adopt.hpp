#pragma once
#include "gro/model.hpp"
#include "gro/scanner.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gro {

struct Adoption {
  std::vector<std::pair<std::string, RepoEntry>> entries; // (category, entry)
  std::vector<std::string> warnings;                      // skipped symlinks
};

// Infer entries from already-scanned symlinks. Links that are broken or whose target's
// parent is not `store` are skipped with a warning. Never touches the filesystem.
auto adopt_symlinks(const std::vector<ObservedSymlink>& links, const std::filesystem::path& store)
    -> Adoption;

// Scan `workspace` and adopt what it holds
auto adopt_workspace(const Workspace& workspace, const std::filesystem::path& store) -> Adoption;

// Merge candidates into `workspace`: entries already present in their category are
// skipped, a repo adopted into several categories is kept in each.
// Returns the number of entries added.
auto merge_adopted(Workspace& workspace, const Adoption& adoption) -> std::size_t;

} // namespace gro
