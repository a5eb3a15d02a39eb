#pragma once
#include <string>
#include "cli/command.hpp"

namespace wtm::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
// Short spelling for an already registered command ("rm" -> "delete")
void register_alias(const std::string& alias, const std::string& name);

// Resolves aliases; nullptr for unknown names
command_fn find_command(const std::string& name);
void print_usage();
// false if `name` is neither a command nor an alias
bool print_command_help(const std::string& name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace wtm::cli
