// Small string and number helpers shared by the text stores
#include "wtm/util.hpp"

#include <charconv>

namespace wtm {

std::optional<long long> parse_int(std::string_view str) {
  const std::string t = strutil::trim(str);
  if (t.empty()) {
    return std::nullopt;
  }
  long long v = 0;
  const auto *first = t.data();
  const auto *last = t.data() + t.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return v;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos)
      nl = text.size();
    std::string line(text.substr(start, nl - start));
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    out.push_back(std::move(line));
    start = nl + 1;
  }
  return out;
}

} // namespace strutil

} // namespace wtm
