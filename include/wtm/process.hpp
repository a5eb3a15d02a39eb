#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtm::process {

struct RunOptions {
  std::filesystem::path cwd;   // empty: inherit
  bool capture = true;         // collect stdout into RunResult::output
  bool quiet_stderr = true;    // send stderr to /dev/null
  bool interactive = false;    // inherit the terminal's stdin (attach, prompts)
};

struct RunResult {
  int exit_code = -1;          // 127: program not runnable, 126: could not enter cwd
  std::string output;          // stdout, if captured

  [[nodiscard]] auto ok() const -> bool { return exit_code == 0; }
};

// Run argv[0] (looked up in PATH) and block until it exits.
// Throws wtm::Error only when the child cannot be spawned at all, which
// includes a cwd that is not an existing directory.
auto run(const std::vector<std::string>& argv, const RunOptions& opts = {}) -> RunResult;

// PATH lookup; a name containing '/' is checked as-is.
auto find_executable(std::string_view name) -> std::optional<std::filesystem::path>;

} // namespace wtm::process
