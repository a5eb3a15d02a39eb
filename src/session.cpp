#include "wtm/session.hpp"

#include "wtm/consts.hpp"
#include "wtm/error.hpp"
#include "wtm/fs.hpp"
#include "wtm/log.hpp"
#include "wtm/process.hpp"
#include "wtm/util.hpp"

#include <thread>
#include <vector>

namespace stdfs = std::filesystem;

namespace wtm::session {

std::string session_name(const stdfs::path &project, std::string_view branch) {
  auto p = project.lexically_normal();
  if (!p.has_filename() && p.has_relative_path())
    p = p.parent_path();
  return p.filename().string() + "-" + std::string(branch);
}

State classify(std::string_view listing, std::string_view name) {
  for (const auto &line : strutil::split_lines(listing)) {
    std::string_view sv{line};
    if (!sv.starts_with(name))
      continue;
    const auto rest = sv.substr(name.size());
    if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t')
      continue; // "app-main2" is not "app-main"
    return rest.find(consts::kExitedMarker) != std::string_view::npos ? State::Exited
                                                                     : State::Alive;
  }
  return State::Absent;
}

Action plan(State state) {
  switch (state) {
  case State::Alive:
    return Action::Attach;
  case State::Exited:
    return Action::Recreate;
  case State::Absent:
    break;
  }
  return Action::Create;
}

std::string_view action_name(Action action) {
  switch (action) {
  case Action::Attach:
    return "attach";
  case Action::Recreate:
    return "recreate";
  case Action::Create:
    break;
  }
  return "create";
}

stdfs::path layout_for(const Context &ctx, const stdfs::path &project) {
  const auto local = project / ctx.worktrees_subdir / consts::kProjectLayout;
  if (fs::exists(local))
    return local;
  if (!ctx.layout_file.empty() && fs::exists(ctx.layout_file))
    return ctx.layout_file;
  return {};
}

Reconciler::Reconciler(const Context &ctx) : multiplexer_(ctx.multiplexer), grace_(ctx.kill_grace) {}

bool Reconciler::available() const { return process::find_executable(multiplexer_).has_value(); }

State Reconciler::state(std::string_view name) const {
  const auto res = process::run({multiplexer_, "list-sessions", "--no-formatting"});
  if (!res.ok())
    return State::Absent; // no server running, or no multiplexer at all
  return classify(res.output, name);
}

Action Reconciler::open(std::string_view name, const stdfs::path &cwd,
                        const stdfs::path &layout) const {
  if (!available())
    throw Error(ErrorKind::MissingDependency, multiplexer_ + " is not installed");

  const Action action = plan(state(name));
  switch (action) {
  case Action::Attach:
    attach(name);
    break;
  case Action::Recreate:
    if (!remove(name))
      log::warn("could not delete exited session " + std::string(name));
    create(name, cwd, layout);
    break;
  case Action::Create:
    create(name, cwd, layout);
    break;
  }
  return action;
}

void Reconciler::kill(std::string_view name) const {
  if (!available())
    return;

  if (state(name) == State::Alive) {
    log::info("Killing active session: " + std::string(name));
    if (!process::run({multiplexer_, "kill-session", std::string(name)}).ok())
      log::warn("kill-session failed for " + std::string(name));
    std::this_thread::sleep_for(grace_);
  }
  if (state(name) != State::Absent) {
    log::info("Deleting session: " + std::string(name));
    if (!remove(name))
      log::warn("could not delete session " + std::string(name));
  }
}

void Reconciler::create(std::string_view name, const stdfs::path &cwd,
                        const stdfs::path &layout) const {
  std::vector<std::string> argv{multiplexer_, "--session", std::string(name)};
  if (!layout.empty()) {
    argv.emplace_back("--layout");
    argv.push_back(layout.string());
  }
  const auto res = process::run(
      argv, {.cwd = cwd, .capture = false, .quiet_stderr = false, .interactive = true});
  if (res.exit_code == 127)
    throw Error(ErrorKind::MissingDependency, "cannot run " + multiplexer_);
  if (!res.ok())
    log::warn(multiplexer_ + " exited with status " + std::to_string(res.exit_code));
}

void Reconciler::attach(std::string_view name) const {
  const auto res = process::run({multiplexer_, "attach", std::string(name)},
                                {.capture = false, .quiet_stderr = false, .interactive = true});
  if (res.exit_code == 127)
    throw Error(ErrorKind::MissingDependency, "cannot run " + multiplexer_);
  if (!res.ok())
    log::warn(multiplexer_ + " exited with status " + std::to_string(res.exit_code));
}

bool Reconciler::remove(std::string_view name) const {
  return process::run({multiplexer_, "delete-session", std::string(name)}).ok();
}

} // namespace wtm::session
