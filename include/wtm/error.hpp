#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wtm {

enum class ErrorKind : std::uint8_t {
  Validation,          // bad branch/path syntax, caller-correctable
  AlreadyExists,
  NotFound,
  AllocationExhausted, // no free port offset within the attempt cap
  UnsafeLocation,      // refused to touch a path outside the worktrees subdir
  CreationFailed,
  DeletionFailed,
  MissingDependency,   // required external program not installed
  Io,
};

// Short lowercase name used in diagnostics ("not found", "unsafe location", ...)
auto kind_name(ErrorKind kind) -> std::string_view;

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace wtm
