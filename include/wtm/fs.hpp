#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wtm::fs {

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& dir);
void ensure_parent_dir(const std::filesystem::path& p);

std::string read_text(const std::filesystem::path& p);
// Returns std::nullopt if the file does not exist.
std::optional<std::string> read_text_if_exists(const std::filesystem::path& p);

// Atomic replace, split in two halves: write_temp leaves the target untouched
// and returns the sibling temp path; commit_temp renames it over the target.
std::filesystem::path write_temp(const std::filesystem::path& p, std::string_view data);
void commit_temp(const std::filesystem::path& tmp, const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::string_view data);

// Create `p` with O_CREAT|O_EXCL and write `content` into it.
// Returns false if the file already exists; throws on any other failure.
bool create_exclusive(const std::filesystem::path& p, std::string_view content);

} // namespace wtm::fs
