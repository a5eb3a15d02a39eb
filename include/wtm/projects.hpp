#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace wtm {

// Flat list of registered project roots, one absolute path per line.
class ProjectList {
public:
  explicit ProjectList(std::filesystem::path file);

  // Append `project` unless already listed. Returns false for a duplicate.
  bool add(const std::filesystem::path& project);

  // Listed projects that still exist on disk, in registration order
  [[nodiscard]] auto list() const -> std::vector<std::filesystem::path>;

private:
  [[nodiscard]] auto load() const -> std::vector<std::string>;

  std::filesystem::path file_;
};

} // namespace wtm
