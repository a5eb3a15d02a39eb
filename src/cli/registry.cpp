#include "cli/registry.hpp"

#include <iostream>
#include <map>
#include <vector>

namespace wtm::cli {

namespace {

struct entry {
  command_fn fn;
  std::string help;
  std::vector<std::string> aliases;
};

std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

std::map<std::string, std::string> &aliases() {
  static std::map<std::string, std::string> a;
  return a;
}

const std::string &canonical_name(const std::string &name) {
  const auto it = aliases().find(name);
  return it == aliases().end() ? name : it->second;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help, .aliases = {}};
}

void register_alias(const std::string &alias, const std::string &name) {
  const auto it = table().find(name);
  if (it == table().end() || table().contains(alias))
    return;
  aliases()[alias] = name;
  it->second.aliases.push_back(alias);
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(canonical_name(name));
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: wtm <command> [args] [--project <dir>]\n\n";
  std::cerr << "commands:\n";
  for (const auto &[name, e] : table()) {
    std::string label = name;
    for (const auto &a : e.aliases)
      label += ", " + a;
    std::cerr << "  " << label << "  " << e.help << "\n";
  }
  std::cerr << "\nrun 'wtm help <command>' for one command\n";
}

bool print_command_help(const std::string &name) {
  const std::string &real = canonical_name(name);
  const auto it = table().find(real);
  if (it == table().end())
    return false;
  std::cout << "wtm " << real << ": " << it->second.help << "\n";
  if (!it->second.aliases.empty()) {
    std::cout << "aliases:";
    for (const auto &a : it->second.aliases)
      std::cout << " " << a;
    std::cout << "\n";
  }
  return true;
}

} // namespace wtm::cli
