#include "wtm/recent.hpp"

#include "wtm/consts.hpp"
#include "wtm/fs.hpp"
#include "wtm/time.hpp"
#include "wtm/util.hpp"

#include <algorithm>

namespace wtm {

std::optional<RecentEntry> parse_recent_line(std::string_view line) {
  const auto first = line.find(consts::kRecentSep);
  if (first == std::string_view::npos)
    return std::nullopt;
  // the branch is the last field, so a '|' inside the project path survives
  const auto last = line.rfind(consts::kRecentSep);
  if (last == first)
    return std::nullopt;
  const auto ts = parse_int(line.substr(0, first));
  if (!ts)
    return std::nullopt;
  RecentEntry e{.timestamp = static_cast<std::time_t>(*ts),
                .project = std::string(line.substr(first + 1, last - first - 1)),
                .branch = std::string(line.substr(last + 1))};
  if (e.project.empty() || e.branch.empty())
    return std::nullopt;
  return e;
}

std::string format_recent_line(const RecentEntry &entry) {
  std::string s = std::to_string(static_cast<long long>(entry.timestamp));
  s.push_back(consts::kRecentSep);
  s += entry.project;
  s.push_back(consts::kRecentSep);
  s += entry.branch;
  return s;
}

RecentRegistry::RecentRegistry(std::filesystem::path file, std::size_t limit)
    : file_(std::move(file)), limit_(limit) {}

std::vector<RecentEntry> RecentRegistry::load() const {
  std::vector<RecentEntry> out;
  const auto text = fs::read_text_if_exists(file_);
  if (!text)
    return out;
  for (const auto &line : strutil::split_lines(*text)) {
    if (auto e = parse_recent_line(line))
      out.push_back(std::move(*e));
  }
  return out;
}

void RecentRegistry::store(const std::vector<RecentEntry> &entries) const {
  std::string data;
  for (const auto &e : entries) {
    data += format_recent_line(e);
    data.push_back(consts::kLF);
  }
  fs::write_file_atomic(file_, data);
}

void RecentRegistry::record(std::string_view project, std::string_view branch) {
  record(project, branch, timeutil::now_epoch());
}

void RecentRegistry::record(std::string_view project, std::string_view branch, std::time_t now) {
  auto entries = load();
  std::erase_if(entries,
                [&](const RecentEntry &e) { return e.project == project && e.branch == branch; });
  // in front, so the stable sort keeps it ahead of entries from the same second
  entries.insert(entries.begin(), RecentEntry{.timestamp = now,
                                              .project = std::string(project),
                                              .branch = std::string(branch)});
  std::ranges::stable_sort(entries, [](const RecentEntry &a, const RecentEntry &b) {
    return a.timestamp > b.timestamp;
  });
  if (entries.size() > limit_)
    entries.resize(limit_);
  store(entries);
}

void RecentRegistry::remove(std::string_view project, std::string_view branch) {
  if (!fs::exists(file_))
    return;
  auto entries = load();
  std::erase_if(entries,
                [&](const RecentEntry &e) { return e.project == project && e.branch == branch; });
  store(entries);
}

std::vector<RecentEntry> RecentRegistry::list() const {
  auto entries = load();
  std::ranges::stable_sort(entries, [](const RecentEntry &a, const RecentEntry &b) {
    return a.timestamp > b.timestamp;
  });
  std::erase_if(entries, [](const RecentEntry &e) { return !fs::is_directory(e.project); });
  return entries;
}

} // namespace wtm
