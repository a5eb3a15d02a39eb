#include "wtm/config.hpp"

#include "wtm/error.hpp"
#include "wtm/fs.hpp"
#include "wtm/util.hpp"
#include "wtm/validation.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace {

long long numeric_value(std::string_view key, const std::string &value, long long min) {
  const auto v = wtm::parse_int(value);
  if (!v || *v < min) {
    throw wtm::Error(wtm::ErrorKind::Validation,
                     "config: bad value for " + std::string(key) + ": '" + value + "'");
  }
  return *v;
}

} // namespace

namespace wtm {

Context make_context(const std::filesystem::path &config_dir) {
  Context ctx;
  ctx.config_dir = config_dir;
  ctx.lock_dir = config_dir / consts::kLocksDir;
  ctx.projects_file = config_dir / consts::kProjectsFile;
  ctx.recent_file = config_dir / consts::kRecentFile;
  ctx.layout_file = config_dir / consts::kLayoutFile;
  ctx.modules_dir = config_dir / consts::kModulesDir;
  return ctx;
}

std::filesystem::path default_config_dir() {
  if (const char *dir = std::getenv("WTM_CONFIG_DIR"); dir && *dir)
    return dir;
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / consts::kConfigDirName;
  if (const char *home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".config" / consts::kConfigDirName;
  throw Error(ErrorKind::MissingDependency, "cannot locate config directory: HOME is not set");
}

void apply_config_file(Context &ctx) {
  const auto text = fs::read_text_if_exists(ctx.config_dir / consts::kConfigFile);
  if (!text)
    return;

  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = strutil::trim(sv.substr(0, colon));
    const std::string value = strutil::trim(sv.substr(colon + 1));

    if (key == "base_port") {
      ctx.base_port = static_cast<int>(numeric_value(key, value, 1));
    } else if (key == "port_step") {
      ctx.port_step = static_cast<int>(numeric_value(key, value, 1));
    } else if (key == "recent_limit") {
      ctx.recent_limit = static_cast<std::size_t>(numeric_value(key, value, 1));
    } else if (key == "stale_lock_minutes") {
      ctx.stale_lock_age = std::chrono::minutes(numeric_value(key, value, 1));
    } else if (key == "multiplexer") {
      ctx.multiplexer = value;
    } else if (key == "layout") {
      ctx.layout_file = value;
    } else if (key == "modules_dir") {
      ctx.modules_dir = value;
    } else if (key == "link" && !value.empty()) {
      if (!is_project_relative(value)) {
        throw Error(ErrorKind::Validation,
                    "config: link must be a path inside the project: '" + value + "'");
      }
      ctx.shared_links.push_back(value);
    }
  }
}

Context load_context() {
  Context ctx = make_context(default_config_dir());
  apply_config_file(ctx);
  return ctx;
}

} // namespace wtm
