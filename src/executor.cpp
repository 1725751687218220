#include "gro/executor.hpp"

#include "gro/fs.hpp"

#include <set>
#include <spdlog/spdlog.h>
#include <stack>
#include <stdexcept>

namespace gro {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

// Drop the link at `link`; refuses anything that is not a symlink
void remove_link(const std::filesystem::path &link) {
  if (!fs::is_symlink(link))
    throw std::runtime_error("not a symlink: " + link.string());
  std::error_code ec;
  std::filesystem::remove(link, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + link.string() + ": " + ec.message());
}

void create_link(const std::filesystem::path &link, const std::filesystem::path &target) {
  // Only an empty directory may be replaced by a link
  if (fs::is_plain_dir(link)) {
    std::error_code ec;
    if (!std::filesystem::is_empty(link, ec) || ec)
      throw std::runtime_error("directory in the way: " + link.string());
    std::filesystem::remove(link, ec);
    if (ec)
      throw std::runtime_error("rmdir failed: " + link.string() + ": " + ec.message());
  } else if (fs::is_symlink(link) || fs::exists(link)) {
    throw std::runtime_error("already exists: " + link.string());
  }
  fs::make_relative_symlink(link, target);
}

int phase(const Action &a) {
  return std::visit(overloaded{[](const RemoveAction &) { return 0; },
                               [](const RelinkAction &) { return 1; },
                               [](const CreateAction &) { return 2; }},
                    a);
}

} // namespace

ApplyResult apply_plan(const std::filesystem::path &workspace_root,
                       const std::filesystem::path &store, const Plan &plan, bool dry_run) {
  ApplyResult res;

  for (int p = 0; p < 3; ++p) {
    for (const auto &action : plan.actions) {
      if (phase(action) != p)
        continue;
      const auto [category, name] = action_location(action);
      const auto link = workspace_root / action_relpath(action);
      const std::string shown = display_path(plan.workspace, category, name);
      try {
        std::visit(overloaded{
                       [&](const RemoveAction &) {
                         if (!dry_run)
                           remove_link(link);
                         res.removed.push_back(shown);
                       },
                       [&](const RelinkAction &a) {
                         if (!dry_run) {
                           remove_link(link);
                           fs::make_relative_symlink(link, store / a.repo_name);
                         }
                         res.updated.push_back(shown);
                       },
                       [&](const CreateAction &a) {
                         if (!dry_run)
                           create_link(link, store / a.repo_name);
                         res.created.push_back(shown);
                       },
                   },
                   action);
        spdlog::debug("apply: {}{}", dry_run ? "(dry run) " : "", describe(action));
      } catch (const std::exception &e) {
        spdlog::warn("apply: {}", e.what());
        res.errors.push_back(e.what());
      }
    }
  }
  return res;
}

std::vector<std::filesystem::path> cleanup_empty_directories(const std::filesystem::path &root,
                                                             bool dry_run) {
  // Collect plain directories parents-first, then visit them in reverse
  std::vector<std::filesystem::path> dirs;
  std::stack<std::filesystem::path> work;
  work.push(root);
  while (!work.empty()) {
    const auto dir = work.top();
    work.pop();
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      const auto &p = it->path();
      if (fs::is_plain_dir(p) && !fs::has_repo_marker(p)) {
        dirs.push_back(p);
        work.push(p);
      }
    }
  }

  std::vector<std::filesystem::path> removed;
  std::set<std::filesystem::path> gone;
  for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
    bool empty = true;
    std::error_code ec;
    for (std::filesystem::directory_iterator child(*it, ec), end; !ec && child != end;
         child.increment(ec)) {
      if (!gone.contains(child->path())) {
        empty = false;
        break;
      }
    }
    if (ec || !empty)
      continue;
    if (!dry_run) {
      std::filesystem::remove(*it, ec);
      if (ec) {
        spdlog::warn("cleanup: rmdir {} failed: {}", it->string(), ec.message());
        continue;
      }
    }
    gone.insert(*it);
    removed.push_back(*it);
  }
  return removed;
}

} // namespace gro
