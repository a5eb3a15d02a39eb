#include "cli/registry.hpp"

int cmd_create(int argc, char **argv);
int cmd_delete(int argc, char **argv);
int cmd_open(int argc, char **argv);
int cmd_list(int, char **);
int cmd_recent(int, char **);
int cmd_register(int, char **);
int cmd_projects(int, char **);
int cmd_cleanup_locks(int, char **);

namespace wtm::cli {

void register_all_commands() {
  register_command("create", ::cmd_create,
                   "Create a worktree with its own port: wtm create <branch> [--open]");
  register_command("delete", ::cmd_delete,
                   "Kill the session and remove the worktree: wtm delete <branch> [--yes]");
  register_command("open", ::cmd_open, "Attach to (or start) the branch session: wtm open <branch>");
  register_command("list", ::cmd_list, "List this project's worktrees and ports");
  register_command("recent", ::cmd_recent, "Show recently opened worktrees");
  register_command("register", ::cmd_register, "Register a project: wtm register [dir]");
  register_command("projects", ::cmd_projects, "List registered projects");
  register_command("cleanup-locks", ::cmd_cleanup_locks, "Delete port locks older than an hour");

  register_alias("new", "create");
  register_alias("rm", "delete");
  register_alias("ls", "list");
}

} // namespace wtm::cli
