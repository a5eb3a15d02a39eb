#include "wtm/port_allocator.hpp"

#include "wtm/consts.hpp"
#include "wtm/env_file.hpp"
#include "wtm/error.hpp"
#include "wtm/fs.hpp"

#include <string>

namespace stdfs = std::filesystem;

namespace {

bool is_lock_name(const std::string &name) {
  using wtm::consts::kLockPrefix;
  using wtm::consts::kLockSuffix;
  return name.size() > kLockPrefix.size() + kLockSuffix.size() && name.starts_with(kLockPrefix) &&
         name.ends_with(kLockSuffix);
}

} // namespace

namespace wtm {

PortAllocator::PortAllocator(const Context &ctx)
    : lock_dir_(ctx.lock_dir), env_file_(ctx.env_file), base_port_(ctx.base_port),
      step_(ctx.port_step), max_attempts_(ctx.max_attempts), stale_age_(ctx.stale_lock_age) {}

stdfs::path PortAllocator::lock_path(int offset) const {
  return lock_dir_ / (std::string(consts::kLockPrefix) + std::to_string(offset) +
                      std::string(consts::kLockSuffix));
}

std::optional<int> PortAllocator::offset_for(int port) const {
  if (port <= base_port_)
    return std::nullopt;
  return (port - base_port_) / step_;
}

std::set<int> PortAllocator::used_offsets(const stdfs::path &worktree_root) const {
  std::set<int> used;
  std::error_code ec;
  if (!stdfs::is_directory(worktree_root, ec))
    return used;

  for (const auto &entry : stdfs::directory_iterator(worktree_root, ec)) {
    std::error_code dir_ec;
    if (!entry.is_directory(dir_ec))
      continue;
    const auto port = env::read_port(entry.path() / env_file_);
    if (!port)
      continue;
    if (const auto off = offset_for(*port))
      used.insert(*off);
  }
  return used;
}

PortLock PortAllocator::allocate(const stdfs::path &worktree_root) const {
  fs::ensure_dir(lock_dir_);

  // Snapshot only; the lock files are what make the result unique.
  const std::set<int> used = used_offsets(worktree_root);

  for (int offset = 1; offset <= max_attempts_; ++offset) {
    auto lock = PortLock::try_acquire(lock_path(offset), offset);
    if (!lock)
      continue; // held by another process
    if (used.contains(offset))
      continue; // lock released as it goes out of scope
    return std::move(*lock);
  }
  throw Error(ErrorKind::AllocationExhausted,
              "failed to allocate port after " + std::to_string(max_attempts_) + " attempts");
}

bool PortAllocator::release(int offset) const noexcept { return remove_if_owned(lock_path(offset)); }

bool PortAllocator::retire(int offset) const {
  std::error_code ec;
  const bool removed = stdfs::remove(lock_path(offset), ec);
  if (ec)
    throw Error(ErrorKind::Io, "remove " + lock_path(offset).string() + ": " + ec.message());
  return removed;
}

std::size_t PortAllocator::cleanup_stale(std::chrono::seconds max_age) const {
  std::error_code ec;
  if (!stdfs::is_directory(lock_dir_, ec))
    return 0;

  const auto cutoff = stdfs::file_time_type::clock::now() - max_age;
  std::size_t removed = 0;
  for (const auto &entry : stdfs::directory_iterator(lock_dir_, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || !is_lock_name(entry.path().filename().string()))
      continue;
    const auto mtime = entry.last_write_time(entry_ec);
    if (entry_ec || mtime >= cutoff)
      continue;
    if (stdfs::remove(entry.path(), entry_ec))
      ++removed;
  }
  return removed;
}

} // namespace wtm
