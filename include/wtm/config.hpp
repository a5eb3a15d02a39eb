#pragma once
#include "wtm/consts.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace wtm {

// Everything the components need to know about their surroundings.
// Built once by the command layer and passed by const reference.
struct Context {
  std::filesystem::path config_dir;
  std::filesystem::path lock_dir;
  std::filesystem::path projects_file;
  std::filesystem::path recent_file;
  std::filesystem::path layout_file;   // global default layout (may not exist)
  std::filesystem::path modules_dir;   // <modules_dir>/<name>/setup collaborators

  int base_port = consts::kBasePort;
  int port_step = consts::kPortStep;
  int max_attempts = consts::kMaxAttempts;
  std::size_t recent_limit = consts::kRecentLimit;
  std::chrono::seconds stale_lock_age = consts::kStaleLockAge;
  std::chrono::milliseconds kill_grace = consts::kKillGrace;

  std::string worktrees_subdir{consts::kWorktreesSubdir};
  std::string env_file{consts::kEnvFile};
  std::string multiplexer{consts::kMultiplexer};
  std::string git = "git";

  // Project-relative paths symlinked into every new worktree
  std::vector<std::string> shared_links;
};

// Defaults rooted at `config_dir`, without reading any file
auto make_context(const std::filesystem::path& config_dir) -> Context;

// $WTM_CONFIG_DIR, else $XDG_CONFIG_HOME/wtm, else $HOME/.config/wtm
auto default_config_dir() -> std::filesystem::path;

// Apply "key: value" overrides from <config_dir>/config (no throw if missing)
void apply_config_file(Context& ctx);

// default_config_dir() + make_context() + apply_config_file()
auto load_context() -> Context;

} // namespace wtm
