#pragma once
#include "wtm/config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace wtm::session {

enum class State : std::uint8_t { Absent, Alive, Exited };
enum class Action : std::uint8_t { Create, Attach, Recreate };

// "<project dir name>-<branch>"
auto session_name(const std::filesystem::path& project, std::string_view branch) -> std::string;

// Classify `name` against `list-sessions --no-formatting` output. A line matches
// when its first word is exactly `name`; "EXITED" on that line means exited.
auto classify(std::string_view listing, std::string_view name) -> State;

// Absent -> Create, Alive -> Attach, Exited -> Recreate
auto plan(State state) -> Action;

auto action_name(Action action) -> std::string_view;

// Project layout (<project>/<worktrees>/.zellij-layout.kdl), else the global
// one from the context, else empty when neither file exists.
auto layout_for(const Context& ctx, const std::filesystem::path& project) -> std::filesystem::path;

/**
 * Drives the external multiplexer. Every call re-reads the session table;
 * nothing about sessions is stored locally.
 */
class Reconciler {
public:
  explicit Reconciler(const Context& ctx);

  [[nodiscard]] auto available() const -> bool;
  [[nodiscard]] auto state(std::string_view name) const -> State;

  // Create, attach or delete-then-create so that the caller ends up inside
  // a live session. Blocks until the multiplexer client exits.
  // Throws Error{MissingDependency} when the multiplexer is not installed.
  auto open(std::string_view name, const std::filesystem::path& cwd,
            const std::filesystem::path& layout) const -> Action;

  // Best-effort teardown: kill if alive, wait the grace period, delete the
  // record if it is still listed. Silently does nothing without a multiplexer.
  void kill(std::string_view name) const;

private:
  void create(std::string_view name, const std::filesystem::path& cwd,
              const std::filesystem::path& layout) const;
  void attach(std::string_view name) const;
  bool remove(std::string_view name) const;

  std::string multiplexer_;
  std::chrono::milliseconds grace_;
};

} // namespace wtm::session
