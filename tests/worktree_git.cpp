#include "wtm/process.hpp"
#include "wtm/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static bool git(const fs::path &repo, std::vector<std::string> args) {
  std::vector<std::string> argv{"git", "-C", repo.string(), "-c", "user.name=Test User",
                                "-c", "user.email=test@example.com"};
  argv.insert(argv.end(), args.begin(), args.end());
  return wtm::process::run(argv).ok();
}

int main() {
  // Porcelain parsing
  const std::string porcelain = "worktree /src/app\n"
                                "HEAD 1111111111111111111111111111111111111111\n"
                                "branch refs/heads/main\n"
                                "\n"
                                "worktree /src/app/.worktrees/feat\n"
                                "HEAD 2222222222222222222222222222222222222222\n"
                                "branch refs/heads/feat\n"
                                "\n"
                                "worktree /src/app/.worktrees/probe\n"
                                "HEAD 3333333333333333333333333333333333333333\n"
                                "detached\n";
  const auto parsed = wtm::worktree::parse_porcelain(porcelain);
  check(parsed.size() == 3, "three blocks");
  if (parsed.size() == 3) {
    check(parsed[0].dir == "/src/app" && parsed[0].branch == "main", "main block");
    check(parsed[1].branch == "feat" && parsed[1].head.size() == 40, "feat block");
    check(parsed[2].detached && parsed[2].branch.empty(), "detached block");
  }
  check(wtm::worktree::parse_porcelain("worktree /bare\nbare\n").at(0).bare, "bare block");

  const fs::path base =
      fs::temp_directory_path() / ("wtm_git_test_" + std::to_string(std::random_device{}()));
  const fs::path repo = base / "app";
  try {
    fs::create_directories(repo);
    if (!git(repo, {"init", "-q"}) || !git(repo, {"commit", "-q", "--allow-empty", "-m", "init"})) {
      std::cerr << "could not set up a git repository\n";
      fs::remove_all(base);
      return 1;
    }

    const auto top = wtm::worktree::main_worktree(repo);
    check(top && wtm::worktree::same_path(*top, repo), "main worktree of the repo");
    check(!wtm::worktree::main_worktree(base).has_value(), "no main worktree outside a repo");

    const wtm::worktree::GitWorktrees wts{repo};
    check(wts.list().size() == 1, "only the main worktree");

    const fs::path feat = repo / ".worktrees" / "feat";
    check(!wts.add(feat, "feat"), "add fails for an unknown branch");
    check(wts.add_new_branch(feat, "feat"), "add -b creates the branch");
    check(wts.contains(feat), "new worktree listed");
    const auto from_inside = wtm::worktree::main_worktree(feat);
    check(from_inside && wtm::worktree::same_path(*from_inside, repo),
          "main worktree resolved from inside a linked worktree");
    const auto found = wts.find_by_branch("feat");
    check(found && wtm::worktree::same_path(found->dir, feat), "found by branch");
    check(!wts.find_by_branch("nope").has_value(), "unknown branch not found");

    const fs::path again = repo / ".worktrees" / "again";
    check(git(repo, {"branch", "again"}), "create branch");
    check(wts.add(again, "again"), "add attaches an existing branch");

    check(wts.remove_force(feat), "remove --force");
    check(!fs::exists(feat) && !wts.contains(feat), "removed worktree gone");

    fs::remove_all(again);
    check(wts.contains(again), "git still lists a hand-deleted worktree");
    check(wts.prune(), "prune");
    check(!wts.contains(again), "prune forgets it");

    bool threw = false;
    try {
      (void)wtm::worktree::GitWorktrees{base}.list();
    } catch (const std::exception &) {
      threw = true;
    }
    check(threw, "listing outside a repository throws");
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    ++failures;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  if (failures != 0)
    return 1;
  std::cout << "worktree_git OK\n";
  return 0;
}
