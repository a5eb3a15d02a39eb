#pragma once
#include "wtm/config.hpp"
#include "wtm/lock.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>

namespace wtm {

/**
 * Hands out port offsets (port = base + offset * step, offset >= 1) that are
 * unique across concurrently running processes.
 *
 * The lock file <lock_dir>/port_<offset>.lock, created with O_CREAT|O_EXCL, is
 * the only mutual exclusion. Offsets already recorded in a sibling worktree's
 * environment file are skipped even when their lock file is gone.
 */
class PortAllocator {
public:
  explicit PortAllocator(const Context& ctx);

  // Lowest free offset, returned as a held lock. Call persist() on it once the
  // reservation is recorded; otherwise the lock is released when it goes out of scope.
  // Throws Error{AllocationExhausted} after max_attempts offsets.
  [[nodiscard]] auto allocate(const std::filesystem::path& worktree_root) const -> PortLock;

  // Remove the lock for `offset` only if this process owns it. Safe to call twice.
  bool release(int offset) const noexcept;

  // Unconditionally drop the lock of a worktree that no longer exists.
  bool retire(int offset) const;

  // Delete lock files older than `max_age`. Returns how many were removed.
  auto cleanup_stale(std::chrono::seconds max_age) const -> std::size_t;
  auto cleanup_stale() const -> std::size_t { return cleanup_stale(stale_age_); }

  // Offsets recorded in <worktree_root>/*/<env_file>
  [[nodiscard]] auto used_offsets(const std::filesystem::path& worktree_root) const -> std::set<int>;

  [[nodiscard]] auto port_for(int offset) const -> int { return base_port_ + offset * step_; }
  [[nodiscard]] auto offset_for(int port) const -> std::optional<int>;
  [[nodiscard]] auto lock_path(int offset) const -> std::filesystem::path;

private:
  std::filesystem::path lock_dir_;
  std::string env_file_;
  int base_port_;
  int step_;
  int max_attempts_;
  std::chrono::seconds stale_age_;
};

} // namespace wtm
