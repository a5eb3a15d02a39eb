#include "wtm/worktree.hpp"

#include "wtm/consts.hpp"
#include "wtm/error.hpp"
#include "wtm/process.hpp"
#include "wtm/util.hpp"

#include <algorithm>

namespace stdfs = std::filesystem;

namespace wtm::worktree {

std::vector<Entry> parse_porcelain(std::string_view text) {
  std::vector<Entry> out;
  std::optional<Entry> cur;
  auto flush = [&] {
    if (cur && !cur->dir.empty())
      out.push_back(std::move(*cur));
    cur.reset();
  };

  for (const auto &line : strutil::split_lines(text)) {
    std::string_view sv{line};
    if (sv.empty()) {
      flush();
    } else if (sv.starts_with(consts::kWorktreePrefix)) {
      flush();
      cur = Entry{};
      cur->dir = std::string(sv.substr(consts::kWorktreePrefix.size()));
    } else if (!cur) {
      continue; // stray line before the first "worktree"
    } else if (sv.starts_with(consts::kHeadPrefix)) {
      cur->head = std::string(sv.substr(consts::kHeadPrefix.size()));
    } else if (sv.starts_with(consts::kBranchPrefix)) {
      auto ref = sv.substr(consts::kBranchPrefix.size());
      if (ref.starts_with(consts::kHeadsRef))
        ref.remove_prefix(consts::kHeadsRef.size());
      cur->branch = std::string(ref);
    } else if (sv == consts::kDetached) {
      cur->detached = true;
    } else if (sv == consts::kBare) {
      cur->bare = true;
    }
  }
  flush();
  return out;
}

bool same_path(const stdfs::path &a, const stdfs::path &b) {
  std::error_code ec1;
  std::error_code ec2;
  const auto ca = stdfs::weakly_canonical(a, ec1);
  const auto cb = stdfs::weakly_canonical(b, ec2);
  if (ec1 || ec2)
    return a.lexically_normal() == b.lexically_normal();
  return ca == cb;
}

std::optional<stdfs::path> main_worktree(const stdfs::path &dir, const std::string &git) {
  const auto res = process::run({git, "-C", dir.string(), "worktree", "list", "--porcelain"});
  if (!res.ok())
    return std::nullopt;
  const auto entries = parse_porcelain(res.output);
  if (entries.empty())
    return std::nullopt;
  return entries.front().dir;
}

GitWorktrees::GitWorktrees(stdfs::path project, std::string git)
    : project_(std::move(project)), git_(std::move(git)) {}

std::vector<std::string> GitWorktrees::git_args(std::initializer_list<std::string> args) const {
  std::vector<std::string> argv{git_, "-C", project_.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

std::vector<Entry> GitWorktrees::list() const {
  const auto res = process::run(git_args({"worktree", "list", "--porcelain"}));
  if (res.exit_code == 127)
    throw Error(ErrorKind::MissingDependency, "cannot run " + git_);
  if (!res.ok())
    throw Error(ErrorKind::NotFound, "not a git repository: " + project_.string());
  return parse_porcelain(res.output);
}

std::optional<Entry> GitWorktrees::find_by_branch(std::string_view branch) const {
  auto all = list();
  const auto it = std::ranges::find_if(all, [&](const Entry &e) { return e.branch == branch; });
  if (it == all.end())
    return std::nullopt;
  return std::move(*it);
}

bool GitWorktrees::contains(const stdfs::path &dir) const {
  return std::ranges::any_of(list(), [&](const Entry &e) { return same_path(e.dir, dir); });
}

bool GitWorktrees::add(const stdfs::path &dir, std::string_view branch) const {
  return process::run(git_args({"worktree", "add", dir.string(), std::string(branch)})).ok();
}

bool GitWorktrees::add_new_branch(const stdfs::path &dir, std::string_view branch) const {
  return process::run(git_args({"worktree", "add", "-b", std::string(branch), dir.string()})).ok();
}

bool GitWorktrees::remove_force(const stdfs::path &dir) const {
  return process::run(git_args({"worktree", "remove", "--force", dir.string()})).ok();
}

bool GitWorktrees::prune() const { return process::run(git_args({"worktree", "prune"})).ok(); }

} // namespace wtm::worktree
