#include "cli/common.hpp"

#include "wtm/config.hpp"
#include "wtm/port_allocator.hpp"

#include <iostream>

int cmd_cleanup_locks(int /*argc*/, char ** /*argv*/) {
  try {
    const wtm::Context ctx = wtm::load_context();
    const wtm::PortAllocator ports{ctx};
    const auto removed = ports.cleanup_stale();
    std::cout << "Removed " << removed << " stale lock(s) from " << ctx.lock_dir.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    return wtm::cli::report("cleanup-locks", e);
  }
}
