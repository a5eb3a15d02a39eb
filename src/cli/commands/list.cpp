#include "cli/common.hpp"

#include "wtm/lifecycle.hpp"

#include <iostream>

int cmd_list(int argc, char **argv) {
  const auto args = wtm::cli::parse_args(argc, argv, {});
  if (!args || !args->positional.empty()) {
    std::cerr << "usage: wtm list [--project <dir>]\n";
    return 2;
  }

  try {
    const wtm::Context ctx = wtm::load_context();
    const wtm::LifecycleManager mgr{ctx, wtm::cli::resolve_project(*args, ctx)};
    const auto worktrees = mgr.list();
    if (worktrees.empty()) {
      std::cout << "(no worktrees)\n";
      return 0;
    }
    for (const auto &[dir, branch, port] : worktrees) {
      std::cout << "  " << (branch.empty() ? "(detached)" : branch);
      if (port)
        std::cout << "  :" << *port;
      std::cout << "  " << dir.string() << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("list", e);
  }
}
