#include "wtm/env_file.hpp"
#include "wtm/error.hpp"
#include "wtm/validation.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static bool rejected(std::string_view branch) {
  try {
    wtm::validate_branch_name(branch);
  } catch (const wtm::Error &e) {
    return e.kind() == wtm::ErrorKind::Validation;
  }
  return false;
}

int main() {
  // Branch names
  for (const char *ok : {"feature-x", "fix_123", "v2.0", "UPPER"})
    check(!rejected(ok), std::string("accepts ") + ok);
  for (const char *bad : {"", "has space", "a~b", "a^b", "a:b", "a?b", "a*b", "a[b", "a\\b",
                          "a..b", "a@{b", "a/b", ".hidden", "name.lock", "tab\there", "a|b"})
    check(rejected(bad), std::string("rejects '") + bad + "'");

  // Lexical containment
  check(wtm::is_under("/p/.worktrees/feat", "/p/.worktrees"), "direct child");
  check(wtm::is_under("/p/.worktrees/feat/", "/p/.worktrees/"), "trailing slashes");
  check(!wtm::is_under("/p/.worktrees", "/p/.worktrees"), "the root itself");
  check(!wtm::is_under("/p", "/p/.worktrees"), "primary checkout");
  check(!wtm::is_under("/p/.worktrees/../src", "/p/.worktrees"), "dot-dot escape");
  check(!wtm::is_under("/p/.worktrees-old/feat", "/p/.worktrees"), "sibling prefix");
  check(!wtm::is_under("p/.worktrees/feat", "/p/.worktrees"), "relative vs absolute");

  // Shared-link entries
  check(wtm::is_project_relative("config/master.key"), "nested relative link");
  check(wtm::is_project_relative("node_modules"), "plain relative link");
  check(!wtm::is_project_relative(""), "empty link");
  check(!wtm::is_project_relative("/home/me/file"), "absolute link");
  check(!wtm::is_project_relative("../../x"), "link escaping the project");
  check(!wtm::is_project_relative("config/../../x"), "dot-dot inside the link");

  // Environment file
  const std::string text = "# local settings\nRAILS_ENV=development\nPORT=3000\n\nEXTRA=\"x\"\n";
  check(wtm::env::get_value(text, "PORT") == "3000", "reads PORT");
  check(wtm::env::get_value(text, "EXTRA") == "x", "unquotes values");
  check(!wtm::env::get_value(text, "POR").has_value(), "key prefix is not a match");
  check(wtm::env::set_value(text, "PORT", "3010") ==
            "# local settings\nRAILS_ENV=development\nPORT=3010\n\nEXTRA=\"x\"\n",
        "replaces in place and keeps other lines");
  check(wtm::env::set_value("A=1", "PORT", "3020") == "A=1\nPORT=3020\n", "appends when absent");

  const fs::path dir =
      fs::temp_directory_path() / ("wtm_env_test_" + std::to_string(std::random_device{}()));
  try {
    fs::create_directories(dir);
    std::ofstream(dir / "template") << "FOO=bar\nPORT=3000\n";
    wtm::env::write_port(dir / ".env", 3030, dir / "template");
    check(wtm::env::read_port(dir / ".env") == 3030, "write_port + read_port");
    std::ifstream env_in(dir / ".env");
    const std::string written{std::istreambuf_iterator<char>(env_in),
                              std::istreambuf_iterator<char>()};
    check(wtm::env::get_value(written, "FOO") == "bar", "template values survive");
    wtm::env::write_port(dir / ".env", 3040, dir / "missing-template");
    check(wtm::env::read_port(dir / ".env") == 3040, "existing file reused without template");
    check(!wtm::env::read_port(dir / "nope").has_value(), "missing file has no port");
    std::ofstream(dir / "bad") << "PORT=abc\n";
    check(!wtm::env::read_port(dir / "bad").has_value(), "non-numeric port ignored");
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    ++failures;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);

  if (failures != 0)
    return 1;
  std::cout << "validation OK\n";
  return 0;
}
