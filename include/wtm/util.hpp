#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtm {

// Parse a base-10 integer that spans the whole of `str` (surrounding blanks allowed)
auto parse_int(std::string_view str) -> std::optional<long long>;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip spaces, tabs and CR from both ends
  auto trim(std::string_view sv) -> std::string;

  // Split on '\n'; a trailing CR on each line is dropped, a final empty line is not returned
  auto split_lines(std::string_view text) -> std::vector<std::string>;
}

}
