#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wtm::env {

// Value of the first "KEY=value" line (surrounding quotes removed).
auto get_value(std::string_view text, std::string_view key) -> std::optional<std::string>;

// Replace the first "KEY=..." line or append one; every other line is kept as-is.
auto set_value(std::string_view text, std::string_view key, std::string_view value) -> std::string;

// PORT of an environment file; std::nullopt if the file or key is missing or not a number.
auto read_port(const std::filesystem::path& env_file) -> std::optional<int>;

// Write `env_file` with PORT=<port>. If `template_file` exists its content is the
// starting point, otherwise an existing `env_file` is, otherwise an empty file.
void write_port(const std::filesystem::path& env_file, int port,
                const std::filesystem::path& template_file = {});

} // namespace wtm::env
