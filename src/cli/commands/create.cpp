#include "cli/common.hpp"

#include "wtm/lifecycle.hpp"

#include <iostream>
#include <string>

int cmd_create(int argc, char **argv) {
  const auto args = wtm::cli::parse_args(argc, argv, {"--open"});
  if (!args || args->positional.size() != 1) {
    std::cerr << "usage: wtm create <branch> [--open] [--project <dir>]\n";
    return 2;
  }
  const std::string &branch = args->positional[0];

  try {
    const wtm::Context ctx = wtm::load_context();
    wtm::LifecycleManager mgr{ctx, wtm::cli::resolve_project(*args, ctx)};
    const auto created = mgr.create(branch);

    std::cout << "Worktree ready: " << created.dir.string() << "\n";
    if (created.port != 0)
      std::cout << "Port: " << created.port << "\n";

    if (args->flags.contains("--open")) {
      const auto action = mgr.open(branch);
      std::cout << "Session " << mgr.session_name(branch) << ": "
                << wtm::session::action_name(action) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("create", e);
  }
}
