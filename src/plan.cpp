#include "gro/plan.hpp"

#include "gro/model.hpp"
#include "gro/util.hpp"

#include <sstream>

namespace gro {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace

std::pair<std::string, std::string> action_location(const Action &action) {
  return std::visit([](const auto &a) { return std::make_pair(a.category, a.symlink_name); },
                    action);
}

std::string action_relpath(const Action &action) {
  const auto [category, name] = action_location(action);
  return link_relpath(category, name);
}

std::string describe(const Action &action) {
  return std::visit(
      overloaded{
          [](const CreateAction &a) {
            std::string s = "+ " + link_relpath(a.category, a.symlink_name);
            if (a.symlink_name != a.repo_name)
              s += " -> " + a.repo_name;
            return s;
          },
          [](const RelinkAction &a) {
            std::ostringstream os;
            os << "~ " << link_relpath(a.category, a.symlink_name) << " ("
               << (a.old_target.empty() ? std::string("?") : a.old_target.string()) << " -> "
               << a.new_target.string() << ")";
            return os.str();
          },
          [](const RemoveAction &a) { return "- " + link_relpath(a.category, a.symlink_name); },
      },
      action);
}

std::string describe(const Conflict &conflict) {
  return std::visit(
      overloaded{
          [](const NameCollision &c) {
            return "duplicate link name '" + c.symlink_name + "' in category '" + c.category +
                   "': repos " + strutil::join(c.repos, ',');
          },
          [](const PathObstruction &c) {
            std::string s = std::string(to_string(c.kind)) + " '" + c.path + "' blocks";
            return s + " symlink '" + c.blocked + "'";
          },
          [](const CategoryRepoCollision &c) {
            return "category path '" + c.category + "' conflicts with repo '" + c.symlink_name +
                   "' in category '" + c.parent_category + "'";
          },
      },
      conflict);
}

std::string display_path(std::string_view workspace, std::string_view category,
                         std::string_view symlink_name) {
  std::string out(workspace);
  out += '/';
  out += link_relpath(category, symlink_name);
  return out;
}

} // namespace gro
