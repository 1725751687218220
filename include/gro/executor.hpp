#pragma once
#include "gro/plan.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gro {

struct ApplyResult {
  std::vector<std::string> created; // display paths ("ws/cat/name")
  std::vector<std::string> updated;
  std::vector<std::string> removed;
  std::vector<std::string> errors;
};

// Perform a plan's actions under `workspace_root`: Remove first, then Relink, then
// Create. New links are relative; parent directories are created on demand.
// Failures are collected in `errors`; nothing is thrown for a single bad action.
// With dry_run, the result lists what would happen and nothing is touched.
auto apply_plan(const std::filesystem::path& workspace_root, const std::filesystem::path& store,
                const Plan& plan, bool dry_run = false) -> ApplyResult;

// Remove empty (non-symlink) directories below root, deepest first. The root itself
// and repository clones are kept. Returns the directories removed (or that would be).
auto cleanup_empty_directories(const std::filesystem::path& root, bool dry_run = false)
    -> std::vector<std::filesystem::path>;

} // namespace gro
