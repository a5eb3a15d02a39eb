#include "cli/common.hpp"

#include "wtm/lifecycle.hpp"

#include <iostream>
#include <string>

int cmd_delete(int argc, char **argv) {
  const auto args = wtm::cli::parse_args(argc, argv, {"--yes"});
  if (!args || args->positional.size() != 1) {
    std::cerr << "usage: wtm delete <branch> [--yes] [--project <dir>]\n";
    return 2;
  }
  const std::string &branch = args->positional[0];
  const bool assume_yes = args->flags.contains("--yes");

  try {
    const wtm::Context ctx = wtm::load_context();
    wtm::LifecycleManager mgr{ctx, wtm::cli::resolve_project(*args, ctx)};
    const auto outcome = mgr.remove(branch, [&](std::string_view message) {
      return assume_yes || wtm::cli::ask_confirm(message);
    });
    if (outcome == wtm::LifecycleManager::DeleteOutcome::Cancelled) {
      std::cout << "Cancelled\n";
      return 0;
    }
    std::cout << "Deleted worktree for '" << branch << "'\n";
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("delete", e);
  }
}
