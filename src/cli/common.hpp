#pragma once
#include "wtm/config.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wtm::cli {

struct Args {
  std::vector<std::string> positional;
  std::set<std::string> flags;          // "--yes", "--open", ...
  std::optional<std::string> project;   // --project <dir>
};

// Split argv (argv[0] is the subcommand) into flags and positionals.
// Returns std::nullopt on an unknown flag or a dangling --project.
auto parse_args(int argc, char **argv, const std::set<std::string>& known_flags)
    -> std::optional<Args>;

// Primary checkout of --project <dir> if given, else of the current directory.
// Throws Error{NotFound} outside a repository.
auto resolve_project(const Args& args, const Context& ctx) -> std::filesystem::path;

// "<message> [y/N] " on stdout, answer from stdin
bool ask_confirm(std::string_view message);

// Single-line "<cmd>: <message>" on stderr; returns the exit status (1)
int report(std::string_view cmd, const std::exception& e);

} // namespace wtm::cli
