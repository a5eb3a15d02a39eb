#include "wtm/lifecycle.hpp"

#include "wtm/env_file.hpp"
#include "wtm/error.hpp"
#include "wtm/fs.hpp"
#include "wtm/log.hpp"
#include "wtm/process.hpp"
#include "wtm/validation.hpp"

#include <algorithm>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace {

stdfs::path canonical_or_self(const stdfs::path &p) {
  std::error_code ec;
  auto c = stdfs::weakly_canonical(stdfs::absolute(p, ec), ec);
  return ec ? p.lexically_normal() : c;
}

} // namespace

namespace wtm {

LifecycleManager::LifecycleManager(Context ctx, const stdfs::path &project)
    : ctx_(std::move(ctx)), project_(canonical_or_self(project)), git_(project_, ctx_.git),
      ports_(ctx_), sessions_(ctx_), recent_(ctx_.recent_file, ctx_.recent_limit) {}

stdfs::path LifecycleManager::worktrees_root() const { return project_ / ctx_.worktrees_subdir; }

stdfs::path LifecycleManager::worktree_dir(std::string_view branch) const {
  return worktrees_root() / std::string(branch);
}

std::string LifecycleManager::session_name(std::string_view branch) const {
  return session::session_name(project_, branch);
}

// Create

LifecycleManager::Created LifecycleManager::create(std::string_view branch) {
  validate_branch_name(branch);

  if (const auto existing = git_.find_by_branch(branch)) {
    throw Error(ErrorKind::AlreadyExists, "worktree for branch '" + std::string(branch) +
                                              "' already exists: " + existing->dir.string());
  }
  const stdfs::path dir = worktree_dir(branch);
  if (fs::exists(dir)) {
    throw Error(ErrorKind::AlreadyExists, "path already exists: " + dir.string());
  }

  fs::ensure_dir(worktrees_root());
  log::info("Creating worktree for '" + std::string(branch) + "' at " + dir.string());
  if (!git_.add(dir, branch)) {
    log::info("Branch '" + std::string(branch) + "' not found, creating it from HEAD");
    if (!git_.add_new_branch(dir, branch)) {
      throw Error(ErrorKind::CreationFailed,
                  "git worktree add failed for branch '" + std::string(branch) + "'");
    }
  }
  if (!git_.contains(dir)) {
    throw Error(ErrorKind::CreationFailed,
                "git does not list the new worktree: " + dir.string());
  }

  // From here on the worktree is valid; later steps only warn.
  Created out{.dir = dir, .branch = std::string(branch)};
  assign_port(out);
  link_shared(dir);
  run_setup(dir, branch);
  touch_recent(branch);
  return out;
}

void LifecycleManager::assign_port(Created &out) {
  if (const std::size_t n = ports_.cleanup_stale(); n > 0)
    log::info("Removed " + std::to_string(n) + " stale port lock(s)");

  // AllocationExhausted propagates; the worktree stays.
  PortLock lock = ports_.allocate(worktrees_root());
  const int port = ports_.port_for(lock.offset());
  try {
    env::write_port(out.dir / ctx_.env_file, port, project_ / ctx_.env_file);
  } catch (const Error &e) {
    log::warn(std::string("could not write ") + ctx_.env_file + ": " + e.what());
    return; // lock released on scope exit
  }
  lock.persist();
  out.offset = lock.offset();
  out.port = port;
  log::info("Allocated port " + std::to_string(port));
}

void LifecycleManager::link_shared(const stdfs::path &dir) const {
  for (const auto &rel : ctx_.shared_links) {
    if (!is_project_relative(rel)) {
      log::warn(rel + " is not a path inside " + project_.string() + " - not linking");
      continue;
    }
    const stdfs::path source = project_ / rel;
    const stdfs::path target = dir / rel;
    if (!fs::exists(source)) {
      log::warn(rel + " not found in " + project_.string() + " - skipping");
      continue;
    }
    std::error_code ec;
    const auto st = stdfs::symlink_status(target, ec);
    if (stdfs::is_directory(st)) {
      log::warn(target.string() + " is a directory - not linking " + rel);
      continue;
    }
    if (stdfs::exists(st))
      stdfs::remove(target, ec);
    stdfs::create_directories(target.parent_path(), ec);
    const auto absolute_source = stdfs::canonical(source, ec);
    if (!ec)
      stdfs::create_symlink(absolute_source, target, ec);
    if (ec) {
      log::warn("could not link " + rel + ": " + ec.message());
      continue;
    }
    log::info("Linked " + rel);
  }
}

void LifecycleManager::run_setup(const stdfs::path &dir, std::string_view branch) const {
  if (!fs::is_directory(ctx_.modules_dir))
    return;

  std::vector<stdfs::path> scripts;
  std::error_code ec;
  for (const auto &entry : stdfs::directory_iterator(ctx_.modules_dir, ec)) {
    const auto script = entry.path() / consts::kSetupScript;
    if (::access(script.c_str(), X_OK) == 0)
      scripts.push_back(script);
  }
  std::ranges::sort(scripts);

  for (const auto &script : scripts) {
    const auto module = script.parent_path().filename().string();
    log::info("Running " + module + " setup");
    const auto res = process::run(
        {script.string(), dir.string(), std::string(branch), project_.string()},
        {.cwd = dir, .capture = false, .quiet_stderr = false});
    if (!res.ok())
      log::warn(module + " setup exited with status " + std::to_string(res.exit_code));
  }
}

void LifecycleManager::touch_recent(std::string_view branch) {
  try {
    recent_.record(project_.string(), branch);
  } catch (const Error &e) {
    log::warn(std::string("could not update recent list: ") + e.what());
  }
}

// Delete

LifecycleManager::DeleteOutcome LifecycleManager::remove(std::string_view branch,
                                                         const Confirm &confirm) {
  const auto entry = git_.find_by_branch(branch);
  if (!entry) {
    throw Error(ErrorKind::NotFound, "no worktree for branch '" + std::string(branch) + "'");
  }
  const stdfs::path dir = entry->dir;
  if (!is_under(dir, worktrees_root())) {
    throw Error(ErrorKind::UnsafeLocation, "refusing to delete " + dir.string() +
                                               ": not under " + worktrees_root().string());
  }

  if (!confirm || !confirm("Delete worktree '" + std::string(branch) + "' at " + dir.string() + "?"))
    return DeleteOutcome::Cancelled;

  sessions_.kill(session_name(branch));

  const auto port = env::read_port(dir / ctx_.env_file);

  log::info("Removing worktree " + dir.string());
  if (!git_.remove_force(dir)) {
    log::warn("git worktree remove failed, removing the directory by hand");
    if (!git_.prune())
      log::warn("git worktree prune failed");
    std::error_code ec;
    stdfs::remove_all(dir, ec);
    if (ec)
      log::warn("remove " + dir.string() + ": " + ec.message());
    if (!git_.prune())
      log::warn("git worktree prune failed");
  }
  if (fs::exists(dir)) {
    throw Error(ErrorKind::DeletionFailed, "could not remove " + dir.string());
  }

  try {
    recent_.remove(project_.string(), branch);
  } catch (const Error &e) {
    log::warn(std::string("could not update recent list: ") + e.what());
  }
  if (port) {
    if (const auto off = ports_.offset_for(*port)) {
      try {
        ports_.retire(*off);
      } catch (const Error &e) {
        log::warn(e.what());
      }
    }
  }
  return DeleteOutcome::Deleted;
}

// Open

session::Action LifecycleManager::open(std::string_view branch) {
  const auto entry = git_.find_by_branch(branch);
  if (!entry) {
    throw Error(ErrorKind::NotFound, "no worktree for branch '" + std::string(branch) + "'");
  }
  if (!fs::is_directory(entry->dir)) {
    throw Error(ErrorKind::NotFound, "worktree directory is missing: " + entry->dir.string() +
                                         " (run 'git worktree prune')");
  }
  if (!sessions_.available()) {
    throw Error(ErrorKind::MissingDependency, ctx_.multiplexer + " is not installed");
  }
  const auto action =
      sessions_.open(session_name(branch), entry->dir, session::layout_for(ctx_, project_));
  touch_recent(branch);
  return action;
}

std::vector<LifecycleManager::Listed> LifecycleManager::list() const {
  std::vector<Listed> out;
  for (const auto &e : git_.list()) {
    if (e.bare || !is_under(e.dir, worktrees_root()))
      continue;
    out.push_back(Listed{.dir = e.dir,
                         .branch = e.branch,
                         .port = env::read_port(e.dir / ctx_.env_file)});
  }
  return out;
}

} // namespace wtm
