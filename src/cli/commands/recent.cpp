#include "cli/common.hpp"

#include "wtm/config.hpp"
#include "wtm/recent.hpp"
#include "wtm/time.hpp"

#include <filesystem>
#include <iostream>

int cmd_recent(int /*argc*/, char ** /*argv*/) {
  try {
    const wtm::Context ctx = wtm::load_context();
    const wtm::RecentRegistry recent{ctx.recent_file, ctx.recent_limit};
    const auto now = wtm::timeutil::now_epoch();

    const auto entries = recent.list();
    if (entries.empty()) {
      std::cout << "(nothing opened recently)\n";
      return 0;
    }
    for (const auto &e : entries) {
      std::cout << "  " << std::filesystem::path(e.project).filename().string() << " / "
                << e.branch << "  (" << wtm::timeutil::relative_age(e.timestamp, now) << ")\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("recent", e);
  }
}
