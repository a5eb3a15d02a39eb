#pragma once
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtm {

struct RecentEntry {
  std::time_t timestamp = 0;
  std::string project;   // absolute project path
  std::string branch;
};

// "timestamp|project|branch"; std::nullopt for malformed lines
auto parse_recent_line(std::string_view line) -> std::optional<RecentEntry>;
auto format_recent_line(const RecentEntry& entry) -> std::string;

/**
 * The N most recently opened (project, branch) pairs, newest first.
 * Every mutation is a read-modify-write finished by an atomic rename; the
 * last writer wins.
 */
class RecentRegistry {
public:
  RecentRegistry(std::filesystem::path file, std::size_t limit);

  [[nodiscard]] auto file() const -> const std::filesystem::path& { return file_; }

  // Drop any entry for the pair, add it stamped `now`, keep the newest `limit`.
  void record(std::string_view project, std::string_view branch);
  void record(std::string_view project, std::string_view branch, std::time_t now);

  // No-op when the store does not exist
  void remove(std::string_view project, std::string_view branch);

  // Fresh read on every call; entries whose project directory is gone are skipped.
  [[nodiscard]] auto list() const -> std::vector<RecentEntry>;

  // Everything on disk, unfiltered, in file order
  [[nodiscard]] auto load() const -> std::vector<RecentEntry>;

private:
  void store(const std::vector<RecentEntry>& entries) const;

  std::filesystem::path file_;
  std::size_t limit_;
};

} // namespace wtm
