#include "cli/common.hpp"

#include "wtm/lifecycle.hpp"

#include <iostream>

int cmd_open(int argc, char **argv) {
  const auto args = wtm::cli::parse_args(argc, argv, {});
  if (!args || args->positional.size() != 1) {
    std::cerr << "usage: wtm open <branch> [--project <dir>]\n";
    return 2;
  }

  try {
    const wtm::Context ctx = wtm::load_context();
    wtm::LifecycleManager mgr{ctx, wtm::cli::resolve_project(*args, ctx)};
    (void)mgr.open(args->positional[0]);
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("open", e);
  }
}
