#include "wtm/config.hpp"
#include "wtm/error.hpp"
#include "wtm/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using wtm::session::Action;
using wtm::session::State;

static int failures = 0;

static void check(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Stand-in multiplexer: logs its arguments, serves list-sessions from a file,
// and forgets every session on delete-session.
static fs::path write_fake_multiplexer(const fs::path &dir) {
  const fs::path script = dir / "fake-zellij";
  std::ofstream(script) << "#!/bin/sh\n"
                        << "echo \"$*\" >> '" << (dir / "calls.log").string() << "'\n"
                        << "case \"$1\" in\n"
                        << "  list-sessions) cat '" << (dir / "sessions").string()
                        << "' 2>/dev/null ;;\n"
                        << "  delete-session) : > '" << (dir / "sessions").string() << "' ;;\n"
                        << "esac\n"
                        << "exit 0\n";
  fs::permissions(script, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
  return script;
}

static void reset(const fs::path &dir, std::string_view sessions) {
  std::ofstream(dir / "sessions", std::ios::trunc) << sessions;
  std::ofstream(dir / "calls.log", std::ios::trunc);
}

int main() {
  // Classification of list-sessions output
  const std::string listing = "shop-main [Created 2h ago]\n"
                              "shop-feat [Created 1d ago] (EXITED - attach to resurrect)\n"
                              "shop-main2 [Created 5m ago]\n";
  check(wtm::session::classify(listing, "shop-main") == State::Alive, "alive");
  check(wtm::session::classify(listing, "shop-feat") == State::Exited, "exited");
  check(wtm::session::classify(listing, "shop-other") == State::Absent, "absent");
  check(wtm::session::classify(listing, "shop") == State::Absent, "prefix is not a match");
  check(wtm::session::classify("shop-solo\n", "shop-solo") == State::Alive, "bare name line");
  check(wtm::session::classify("", "x") == State::Absent, "empty listing");

  check(wtm::session::plan(State::Absent) == Action::Create, "absent -> create");
  check(wtm::session::plan(State::Alive) == Action::Attach, "alive -> attach");
  check(wtm::session::plan(State::Exited) == Action::Recreate, "exited -> recreate");
  check(wtm::session::session_name("/home/me/shop/", "feat") == "shop-feat", "session name");

  const fs::path dir =
      fs::temp_directory_path() / ("wtm_session_test_" + std::to_string(std::random_device{}()));
  try {
    fs::create_directories(dir / "work");
    auto ctx = wtm::make_context(dir / "cfg");
    ctx.multiplexer = write_fake_multiplexer(dir).string();
    ctx.kill_grace = std::chrono::milliseconds(0);
    const wtm::session::Reconciler rec{ctx};
    check(rec.available(), "fake multiplexer found");

    // Exited session: delete the record, then create; never attach
    reset(dir, "shop-feat [Created 1d ago] (EXITED - attach to resurrect)\n");
    check(rec.open("shop-feat", dir / "work", {}) == Action::Recreate, "recreate chosen");
    {
      const std::string calls = slurp(dir / "calls.log");
      const auto del = calls.find("delete-session shop-feat");
      const auto create = calls.find("--session shop-feat");
      check(del != std::string::npos && create != std::string::npos && del < create,
            "delete before create");
      check(calls.find("attach") == std::string::npos, "exited session never attached");
    }

    // Alive session: attach only
    reset(dir, "shop-main [Created 2h ago]\n");
    check(rec.open("shop-main", dir / "work", {}) == Action::Attach, "attach chosen");
    check(slurp(dir / "calls.log").find("attach shop-main") != std::string::npos, "attach issued");

    // Absent: create with layout
    reset(dir, "");
    std::ofstream(dir / "layout.kdl") << "layout {}\n";
    check(rec.open("shop-new", dir / "work", dir / "layout.kdl") == Action::Create,
          "create chosen");
    check(slurp(dir / "calls.log").find("--session shop-new --layout " +
                                        (dir / "layout.kdl").string()) != std::string::npos,
          "create passes layout");

    // Teardown of a live session: kill, then delete the leftover record
    reset(dir, "shop-main [Created 2h ago]\n");
    rec.kill("shop-main");
    {
      const std::string calls = slurp(dir / "calls.log");
      check(calls.find("kill-session shop-main") != std::string::npos, "kill issued");
      check(calls.find("delete-session shop-main") != std::string::npos, "record deleted");
    }

    // Teardown of an absent session touches nothing
    reset(dir, "");
    rec.kill("shop-gone");
    {
      const std::string calls = slurp(dir / "calls.log");
      check(calls.find("kill-session") == std::string::npos &&
                calls.find("delete-session") == std::string::npos,
            "nothing to tear down");
    }

    // Layout lookup: project file wins over the global one
    fs::create_directories(dir / "proj" / ".worktrees");
    ctx.layout_file = dir / "layout.kdl";
    check(wtm::session::layout_for(ctx, dir / "proj") == dir / "layout.kdl", "global layout");
    std::ofstream(dir / "proj" / ".worktrees" / ".zellij-layout.kdl") << "layout {}\n";
    check(wtm::session::layout_for(ctx, dir / "proj") ==
              dir / "proj" / ".worktrees" / ".zellij-layout.kdl",
          "project layout");
    ctx.layout_file = dir / "missing.kdl";
    fs::remove(dir / "proj" / ".worktrees" / ".zellij-layout.kdl");
    check(wtm::session::layout_for(ctx, dir / "proj").empty(), "no layout");

    // A missing working directory is reported as such, not as a missing multiplexer
    bool missing_dir = false;
    try {
      (void)rec.open("shop-gone", dir / "gone", {});
    } catch (const wtm::Error &e) {
      missing_dir = e.kind() == wtm::ErrorKind::NotFound;
    }
    check(missing_dir, "open in a missing directory");

    // No multiplexer: teardown is silent, open is an error
    auto bare = wtm::make_context(dir / "cfg");
    bare.multiplexer = (dir / "no-such-multiplexer").string();
    const wtm::session::Reconciler none{bare};
    none.kill("anything");
    bool threw = false;
    try {
      (void)none.open("anything", dir / "work", {});
    } catch (const wtm::Error &e) {
      threw = e.kind() == wtm::ErrorKind::MissingDependency;
    }
    check(threw, "open without multiplexer fails");
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    ++failures;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (failures != 0)
    return 1;
  std::cout << "session OK\n";
  return 0;
}
