#include "wtm/validation.hpp"

#include "wtm/error.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace wtm {

namespace {

[[noreturn]] void invalid(std::string_view branch, std::string_view why) {
  throw Error(ErrorKind::Validation,
              "invalid branch name '" + std::string(branch) + "': " + std::string(why));
}

} // namespace

void validate_branch_name(std::string_view branch) {
  if (branch.empty())
    throw Error(ErrorKind::Validation, "branch name cannot be empty");

  constexpr std::string_view kForbidden = "~^:?*[]\\|";
  const bool bad_char = std::ranges::any_of(branch, [&](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0 ||
           std::iscntrl(static_cast<unsigned char>(c)) != 0 ||
           kForbidden.find(c) != std::string_view::npos;
  });
  if (bad_char || branch.find("..") != std::string_view::npos ||
      branch.find("@{") != std::string_view::npos) {
    invalid(branch, "cannot contain spaces or any of ~^:?*[]\\| '..' '@{'");
  }
  if (branch.find('/') != std::string_view::npos)
    invalid(branch, "cannot contain '/'");
  if (branch.front() == '.')
    invalid(branch, "cannot start with '.'");
  if (branch.ends_with(".lock"))
    invalid(branch, "cannot end with '.lock'");
}

bool is_under(const std::filesystem::path &dir, const std::filesystem::path &base) {
  if (dir.empty() || base.empty())
    return false;
  auto d = dir.lexically_normal();
  auto b = base.lexically_normal();
  // "a/b/" -> "a/b"
  if (!d.has_filename() && d.has_relative_path())
    d = d.parent_path();
  if (!b.has_filename() && b.has_relative_path())
    b = b.parent_path();
  if (d.is_absolute() != b.is_absolute())
    return false;

  const auto rel = d.lexically_relative(b);
  if (rel.empty() || rel == ".")
    return false;
  const std::string first = rel.begin()->string();
  return first != ".." && first != ".";
}

bool is_project_relative(std::string_view rel) {
  if (rel.empty())
    return false;
  const std::filesystem::path p{rel};
  if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
    return false;
  return std::none_of(p.begin(), p.end(),
                      [](const std::filesystem::path &part) { return part == ".."; });
}

} // namespace wtm
