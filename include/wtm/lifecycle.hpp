#pragma once
#include "wtm/config.hpp"
#include "wtm/port_allocator.hpp"
#include "wtm/recent.hpp"
#include "wtm/session.hpp"
#include "wtm/worktree.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtm {

/**
 * Creates, opens, lists and deletes the worktrees of one project.
 *
 * Worktrees live at <project>/<worktrees_subdir>/<branch>. git's worktree
 * registry is the only source of truth for which worktrees exist.
 * Failures after git has acknowledged a new worktree are warnings, except
 * port exhaustion which is reported to the caller (the worktree is kept).
 */
class LifecycleManager {
public:
  using Confirm = std::function<bool(std::string_view message)>;

  struct Created {
    std::filesystem::path dir;
    std::string branch;
    int offset = 0; // 0 when no port could be recorded
    int port = 0;
  };

  struct Listed {
    std::filesystem::path dir;
    std::string branch;
    std::optional<int> port;
  };

  enum class DeleteOutcome : std::uint8_t { Deleted, Cancelled };

  LifecycleManager(Context ctx, const std::filesystem::path& project);

  [[nodiscard]] auto project() const -> const std::filesystem::path& { return project_; }
  [[nodiscard]] auto worktrees_root() const -> std::filesystem::path;
  [[nodiscard]] auto worktree_dir(std::string_view branch) const -> std::filesystem::path;
  [[nodiscard]] auto session_name(std::string_view branch) const -> std::string;

  // validate -> git worktree add -> port + env file -> links -> setup -> recent
  auto create(std::string_view branch) -> Created;

  // resolve via git -> safety gate -> confirm -> kill session -> remove -> recent
  // Nothing destructive runs unless the directory is under worktrees_root()
  // and `confirm` returned true.
  auto remove(std::string_view branch, const Confirm& confirm) -> DeleteOutcome;

  // Record the access, then create/attach/recreate the branch's session
  auto open(std::string_view branch) -> session::Action;

  // Worktrees below worktrees_root(), as git lists them
  [[nodiscard]] auto list() const -> std::vector<Listed>;

  [[nodiscard]] auto ports() const -> const PortAllocator& { return ports_; }
  [[nodiscard]] auto recent() const -> const RecentRegistry& { return recent_; }

private:
  void assign_port(Created& out);
  void link_shared(const std::filesystem::path& dir) const;
  void run_setup(const std::filesystem::path& dir, std::string_view branch) const;
  void touch_recent(std::string_view branch);

  Context ctx_;
  std::filesystem::path project_;
  worktree::GitWorktrees git_;
  PortAllocator ports_;
  session::Reconciler sessions_;
  RecentRegistry recent_;
};

} // namespace wtm
