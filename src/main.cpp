#include "cli/registry.hpp"

#include <iostream>
#include <string>

#ifndef WTM_VERSION
#define WTM_VERSION "unknown"
#endif

int main(int argc, char **argv) {
  wtm::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    wtm::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "--version") {
    std::cout << "wtm " << WTM_VERSION << "\n";
    return 0;
  }
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    if (argc < 3) {
      wtm::cli::print_usage();
      return 0;
    }
    if (!wtm::cli::print_command_help(argv[2])) {
      std::cerr << "unknown command: " << argv[2] << "\n";
      return 2;
    }
    return 0;
  }

  const auto fn = wtm::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    wtm::cli::print_usage();
    return 2;
  }
  // The handler sees the subcommand as argv[0]
  return fn(argc - 1, argv + 1);
}
