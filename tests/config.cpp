#include "wtm/config.hpp"
#include "wtm/error.hpp"
#include "wtm/fs.hpp"
#include "wtm/projects.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("wtm_config_test_" + std::to_string(std::random_device{}()));

  try {
    fs::create_directories(base / "cfg");

    // Defaults
    const auto ctx = wtm::make_context(base / "cfg");
    if (ctx.lock_dir != base / "cfg" / "locks" || ctx.recent_file != base / "cfg" / "recent" ||
        ctx.base_port != 3000 || ctx.port_step != 10 || ctx.max_attempts != 100 ||
        ctx.recent_limit != 3 || ctx.stale_lock_age != std::chrono::minutes(60) ||
        ctx.worktrees_subdir != ".worktrees" || ctx.env_file != ".env") {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    // Environment override of the config directory
    ::setenv("WTM_CONFIG_DIR", (base / "cfg").c_str(), 1);
    if (wtm::default_config_dir() != base / "cfg") {
      std::cerr << "WTM_CONFIG_DIR ignored\n";
      return 1;
    }

    // Config file overrides
    std::ofstream(base / "cfg" / "config") << "# wtm settings\n"
                                           << "base_port: 4000\n"
                                           << "port_step: 5\n"
                                           << "recent_limit: 5\n"
                                           << "multiplexer: /opt/zellij\n"
                                           << "link: config/master.key\n"
                                           << "link: node_modules\n"
                                           << "unknown_key: whatever\n";
    const auto loaded = wtm::load_context();
    if (loaded.base_port != 4000 || loaded.port_step != 5 || loaded.recent_limit != 5 ||
        loaded.multiplexer != "/opt/zellij" || loaded.shared_links.size() != 2 ||
        loaded.shared_links[1] != "node_modules") {
      std::cerr << "config file not applied\n";
      return 1;
    }

    std::ofstream(base / "cfg" / "config", std::ios::trunc) << "base_port: lots\n";
    bool threw = false;
    try {
      (void)wtm::load_context();
    } catch (const wtm::Error &e) {
      threw = e.kind() == wtm::ErrorKind::Validation;
    }
    if (!threw) {
      std::cerr << "bad numeric value accepted\n";
      return 1;
    }

    for (const char *link : {"/etc/hosts", "../outside", "config/../../x"}) {
      std::ofstream(base / "cfg" / "config", std::ios::trunc) << "link: " << link << "\n";
      bool rejected = false;
      try {
        (void)wtm::load_context();
      } catch (const wtm::Error &e) {
        rejected = e.kind() == wtm::ErrorKind::Validation;
      }
      if (!rejected) {
        std::cerr << "link outside the project accepted: " << link << "\n";
        return 1;
      }
    }

    // Optional reads
    if (wtm::fs::read_text_if_exists(base / "cfg" / "absent").has_value() ||
        wtm::fs::read_text_if_exists(base / "cfg" / "config") != "link: config/../../x\n") {
      std::cerr << "read_text_if_exists mismatch\n";
      return 1;
    }

    // Project list: duplicates suppressed, vanished projects skipped
    fs::create_directories(base / "a");
    fs::create_directories(base / "b");
    wtm::ProjectList projects{base / "cfg" / "projects"};
    if (!projects.add(base / "a") || !projects.add(base / "b") || projects.add(base / "a")) {
      std::cerr << "duplicate suppression broken\n";
      return 1;
    }
    if (!projects.add(base / "gone")) {
      std::cerr << "add of a third project failed\n";
      return 1;
    }
    const auto listed = projects.list();
    if (listed.size() != 2 || listed[0] != base / "a" || listed[1] != base / "b") {
      std::cerr << "project list mismatch\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  std::cout << "config OK\n";
  return 0;
}
