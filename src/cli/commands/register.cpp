#include "cli/common.hpp"

#include "wtm/projects.hpp"

#include <iostream>

int cmd_register(int argc, char **argv) {
  auto args = wtm::cli::parse_args(argc, argv, {});
  if (!args || args->positional.size() > 1 || (args->project && !args->positional.empty())) {
    std::cerr << "usage: wtm register [dir]\n";
    return 2;
  }
  if (!args->positional.empty())
    args->project = args->positional[0];
  try {
    const wtm::Context ctx = wtm::load_context();
    const auto project = wtm::cli::resolve_project(*args, ctx);
    wtm::ProjectList projects{ctx.projects_file};
    if (!projects.add(project)) {
      std::cout << "Project already registered: " << project.string() << "\n";
      return 0;
    }
    std::cout << "Registered " << project.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("register", e);
  }
}

int cmd_projects(int /*argc*/, char ** /*argv*/) {
  try {
    const wtm::Context ctx = wtm::load_context();
    const wtm::ProjectList projects{ctx.projects_file};
    for (const auto &p : projects.list())
      std::cout << p.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("projects", e);
  }
}
