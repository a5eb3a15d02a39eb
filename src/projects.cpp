#include "wtm/projects.hpp"

#include "wtm/consts.hpp"
#include "wtm/fs.hpp"
#include "wtm/util.hpp"

#include <algorithm>

namespace wtm {

ProjectList::ProjectList(std::filesystem::path file) : file_(std::move(file)) {}

std::vector<std::string> ProjectList::load() const {
  std::vector<std::string> out;
  const auto text = fs::read_text_if_exists(file_);
  if (!text)
    return out;
  for (auto &line : strutil::split_lines(*text)) {
    std::string p = strutil::trim(line);
    if (!p.empty())
      out.push_back(std::move(p));
  }
  return out;
}

bool ProjectList::add(const std::filesystem::path &project) {
  const std::string p = project.lexically_normal().string();
  auto entries = load();
  if (std::ranges::find(entries, p) != entries.end())
    return false;
  entries.push_back(p);

  std::string data;
  for (const auto &e : entries) {
    data += e;
    data.push_back(consts::kLF);
  }
  fs::write_file_atomic(file_, data);
  return true;
}

std::vector<std::filesystem::path> ProjectList::list() const {
  std::vector<std::filesystem::path> out;
  for (const auto &e : load()) {
    if (fs::is_directory(e))
      out.emplace_back(e);
  }
  return out;
}

} // namespace wtm
