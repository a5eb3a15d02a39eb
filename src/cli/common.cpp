#include "cli/common.hpp"

#include "wtm/error.hpp"
#include "wtm/util.hpp"
#include "wtm/worktree.hpp"

#include <cctype>
#include <iostream>

namespace wtm::cli {

std::optional<Args> parse_args(int argc, char **argv, const std::set<std::string> &known_flags) {
  Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--project") {
      if (i + 1 >= argc)
        return std::nullopt;
      out.project = argv[++i];
    } else if (a.starts_with("--")) {
      if (!known_flags.contains(a))
        return std::nullopt;
      out.flags.insert(a);
    } else {
      out.positional.push_back(a);
    }
  }
  return out;
}

std::filesystem::path resolve_project(const Args &args, const Context &ctx) {
  const std::filesystem::path start =
      args.project ? std::filesystem::path(*args.project) : std::filesystem::current_path();
  // From inside a linked worktree this still lands on the primary checkout.
  auto top = worktree::main_worktree(start, ctx.git);
  if (!top)
    throw Error(ErrorKind::NotFound, "not a git repository: " + start.string());
  return *top;
}

bool ask_confirm(std::string_view message) {
  std::cout << message << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  answer = strutil::trim(answer);
  return !answer.empty() && std::tolower(static_cast<unsigned char>(answer[0])) == 'y';
}

int report(std::string_view cmd, const std::exception &e) {
  if (const auto *err = dynamic_cast<const Error *>(&e)) {
    std::cerr << cmd << ": " << kind_name(err->kind()) << ": " << e.what() << "\n";
    return 1;
  }
  std::cerr << cmd << ": " << e.what() << "\n";
  return 1;
}

} // namespace wtm::cli
