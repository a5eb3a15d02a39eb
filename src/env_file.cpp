#include "wtm/env_file.hpp"

#include "wtm/consts.hpp"
#include "wtm/fs.hpp"
#include "wtm/util.hpp"

#include <vector>

namespace {

bool is_key_line(std::string_view line, std::string_view key) {
  return line.size() > key.size() && line.starts_with(key) && line[key.size()] == '=';
}

std::string unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
    return v.substr(1, v.size() - 2);
  return v;
}

} // namespace

namespace wtm::env {

std::optional<std::string> get_value(std::string_view text, std::string_view key) {
  for (const auto &line : strutil::split_lines(text)) {
    if (is_key_line(line, key))
      return unquote(strutil::trim(std::string_view(line).substr(key.size() + 1)));
  }
  return std::nullopt;
}

std::string set_value(std::string_view text, std::string_view key, std::string_view value) {
  std::vector<std::string> lines = strutil::split_lines(text);
  const std::string assignment = std::string(key) + "=" + std::string(value);
  bool replaced = false;
  for (auto &line : lines) {
    if (is_key_line(line, key)) {
      line = assignment;
      replaced = true;
      break;
    }
  }
  if (!replaced)
    lines.push_back(assignment);

  std::string out;
  for (const auto &line : lines) {
    out += line;
    out.push_back(consts::kLF);
  }
  return out;
}

std::optional<int> read_port(const std::filesystem::path &env_file) {
  const auto text = fs::read_text_if_exists(env_file);
  if (!text)
    return std::nullopt;
  const auto value = get_value(*text, consts::kPortKey);
  if (!value)
    return std::nullopt;
  const auto port = parse_int(*value);
  if (!port || *port <= 0 || *port > 65535)
    return std::nullopt;
  return static_cast<int>(*port);
}

void write_port(const std::filesystem::path &env_file, int port,
                const std::filesystem::path &template_file) {
  std::string base;
  if (!template_file.empty() && fs::exists(template_file)) {
    base = fs::read_text(template_file);
  } else if (auto existing = fs::read_text_if_exists(env_file)) {
    base = std::move(*existing);
  }
  fs::write_file_atomic(env_file, set_value(base, consts::kPortKey, std::to_string(port)));
}

} // namespace wtm::env
