#pragma once
#include <filesystem>
#include <string_view>

namespace wtm {

// Throws Error{Validation} unless `branch` can be used both as a git branch
// and as a single directory name under the worktrees subdirectory.
void validate_branch_name(std::string_view branch);

// Lexical containment: true when `dir` normalises to a path strictly below `base`.
// Nothing is resolved on disk.
auto is_under(const std::filesystem::path& dir, const std::filesystem::path& base) -> bool;

// A shared-link entry must name something inside the project: relative, and
// without any ".." component.
auto is_project_relative(std::string_view rel) -> bool;

} // namespace wtm
