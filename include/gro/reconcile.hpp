#pragma once
#include "gro/plan.hpp"
#include "gro/scanner.hpp"

#include <set>
#include <string>

namespace gro {

class Workspace;
struct Config;

struct ReconcileOptions {
  bool prune = false; // emit Remove for undeclared links instead of reporting orphans
};

// Diff one workspace's declared category tree against a snapshot of its directory.
// Pure: reads only its arguments. `store_repos` is the result of scan_store() and only
// feeds the missing-repository warnings.
//
// - Create for absent links, Relink for links whose resolved target differs from
//   snapshot.expected_target(repo), nothing for satisfied ones.
// - Undeclared links become Remove (prune) or orphans.
// - Conflicting locations are reported and their actions dropped; nothing is guessed.
auto reconcile(const Workspace& workspace, const WorkspaceSnapshot& snapshot,
               const std::set<std::string>& store_repos, const ReconcileOptions& options = {})
    -> Plan;

// Scan `workspace` and the configured store, then reconcile.
auto reconcile_workspace(const Config& config, const Workspace& workspace,
                         const ReconcileOptions& options = {}) -> Plan;

} // namespace gro
