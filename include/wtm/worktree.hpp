#pragma once
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtm::worktree {

// One block of `git worktree list --porcelain`
struct Entry {
  std::filesystem::path dir;
  std::string head;    // 40-hex, empty for bare
  std::string branch;  // short name ("feature-x"), empty when detached
  bool detached = false;
  bool bare = false;
};

auto parse_porcelain(std::string_view text) -> std::vector<Entry>;

// Compare two paths after resolving whatever exists of them on disk
auto same_path(const std::filesystem::path& a, const std::filesystem::path& b) -> bool;

// The primary checkout of the repository `dir` belongs to, even when `dir`
// is inside a linked worktree: the first block of `git worktree list`.
auto main_worktree(const std::filesystem::path& dir, const std::string& git = "git")
    -> std::optional<std::filesystem::path>;

/**
 * git's own worktree registry for one project. Nothing is cached: every
 * query runs `git worktree list` again.
 */
class GitWorktrees {
public:
  explicit GitWorktrees(std::filesystem::path project, std::string git = "git");

  [[nodiscard]] auto project() const -> const std::filesystem::path& { return project_; }

  // Throws Error{NotFound} if the project is not a git repository
  [[nodiscard]] auto list() const -> std::vector<Entry>;
  [[nodiscard]] auto find_by_branch(std::string_view branch) const -> std::optional<Entry>;
  [[nodiscard]] auto contains(const std::filesystem::path& dir) const -> bool;

  // The mutating commands report success; callers decide on fallbacks.
  bool add(const std::filesystem::path& dir, std::string_view branch) const;
  bool add_new_branch(const std::filesystem::path& dir, std::string_view branch) const;
  bool remove_force(const std::filesystem::path& dir) const;
  bool prune() const;

private:
  [[nodiscard]] auto git_args(std::initializer_list<std::string> args) const -> std::vector<std::string>;

  std::filesystem::path project_;
  std::string git_;
};

} // namespace wtm::worktree
