#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace wtm::consts {

// Directory and file names
inline constexpr std::string_view kConfigDirName   = "wtm";
inline constexpr std::string_view kLocksDir        = "locks";
inline constexpr std::string_view kProjectsFile    = "projects";
inline constexpr std::string_view kRecentFile      = "recent";
inline constexpr std::string_view kConfigFile      = "config";
inline constexpr std::string_view kModulesDir      = "modules";
inline constexpr std::string_view kLayoutFile      = "layout.kdl";
inline constexpr std::string_view kWorktreesSubdir = ".worktrees";
inline constexpr std::string_view kEnvFile         = ".env";
inline constexpr std::string_view kProjectLayout   = ".zellij-layout.kdl";
inline constexpr std::string_view kSetupScript     = "setup";

// ——— Port allocation ———
inline constexpr int kBasePort    = 3000;
inline constexpr int kPortStep    = 10;
inline constexpr int kMaxAttempts = 100; // offsets 1..100
inline constexpr std::string_view kLockPrefix = "port_";
inline constexpr std::string_view kLockSuffix = ".lock";
inline constexpr std::chrono::minutes kStaleLockAge{60};

// ——— Sessions ———
inline constexpr std::string_view kMultiplexer  = "zellij";
inline constexpr std::string_view kExitedMarker = "EXITED";
inline constexpr std::chrono::milliseconds kKillGrace{500};

// ——— Recent-access registry ———
inline constexpr std::size_t kRecentLimit = 3;
inline constexpr char kRecentSep = '|';

// ——— Environment file ———
inline constexpr std::string_view kPortKey = "PORT";

// ——— git worktree --porcelain prefixes ———
inline constexpr std::string_view kWorktreePrefix = "worktree ";
inline constexpr std::string_view kHeadPrefix     = "HEAD ";
inline constexpr std::string_view kBranchPrefix   = "branch ";
inline constexpr std::string_view kHeadsRef       = "refs/heads/";
inline constexpr std::string_view kDetached       = "detached";
inline constexpr std::string_view kBare           = "bare";

// ——— Common characters ———
inline constexpr char kLF = '\n';

} // namespace wtm::consts
