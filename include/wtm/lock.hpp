#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace wtm {

// Owner token written into lock files: the current pid in decimal
auto owner_token() -> std::string;

// Remove `path` only if its content is our owner token.
// Returns true if a file was removed. Never throws.
bool remove_if_owned(const std::filesystem::path& path) noexcept;

/**
 * Scoped reservation of one port offset, backed by a lock file created with
 * O_CREAT|O_EXCL. Destroying a held lock removes the file (if still ours)
 * unless persist() was called, in which case the file stays on disk as the
 * durable record of the allocation.
 */
class PortLock {
public:
  PortLock() = default;

  PortLock(const PortLock&) = delete;
  auto operator=(const PortLock&) -> PortLock& = delete;

  PortLock(PortLock&& other) noexcept;
  auto operator=(PortLock&& other) noexcept -> PortLock&;

  ~PortLock() { release(); }

  // std::nullopt if another process already holds the file
  static auto try_acquire(const std::filesystem::path& path, int offset) -> std::optional<PortLock>;

  [[nodiscard]] auto offset() const noexcept -> int { return offset_; }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }
  [[nodiscard]] auto held() const noexcept -> bool { return held_; }

  // Keep the file after this object goes away
  void persist() noexcept { held_ = false; }

  void release() noexcept;

private:
  PortLock(std::filesystem::path path, int offset) noexcept
      : path_(std::move(path)), offset_(offset), held_(true) {}

  std::filesystem::path path_;
  int offset_{0};
  bool held_{false};
};

} // namespace wtm
