#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_status(int argc, char **argv);
int cmd_apply(int argc, char **argv);
int cmd_sync(int, char **);
int cmd_add(int, char **);
int cmd_adopt(int, char **);
int cmd_check(int, char **);
int cmd_fmt(int, char **);
int cmd_ls(int, char **);

namespace gro::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "[--code <dir>] [-w <dir>]... [--scan] [--force]",
                   "Write a new config");
  register_command("status", ::cmd_status, "[-w <workspace>]",
                   "Show pending symlink changes, orphans and conflicts");
  register_command("apply", ::cmd_apply, "[--prune] [-w <workspace>]",
                   "Create and update symlinks to match the config");
  register_command("sync", ::cmd_sync, "[-w <workspace>]",
                   "Add uncategorized repos to a workspace root");
  register_command("add", ::cmd_add, "<repo[:alias]> [-w <workspace>] [--category <path>]",
                   "Declare a repo in a workspace category");
  register_command("adopt", ::cmd_adopt, "[-w <workspace>]",
                   "Import existing workspace symlinks into the config");
  register_command("check", ::cmd_check, "", "Validate the config against the filesystem");
  register_command("fmt", ::cmd_fmt, "", "Rewrite the config in canonical form");
  register_command("ls", ::cmd_ls, "[-w <workspace>]", "List categories and entry counts");
}

} // namespace gro::cli
