#include "wtm/config.hpp"
#include "wtm/lock.hpp"
#include "wtm/port_allocator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <utility>

namespace fs = std::filesystem;

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("wtm_lock_test_" + std::to_string(std::random_device{}()));
  const auto ctx = wtm::make_context(base);
  fs::create_directories(ctx.lock_dir);
  const wtm::PortAllocator ports{ctx};

  try {
    // Exclusive creation
    auto first = wtm::PortLock::try_acquire(ports.lock_path(7), 7);
    if (!first || !first->held()) {
      std::cerr << "first acquire failed\n";
      return 1;
    }
    if (wtm::PortLock::try_acquire(ports.lock_path(7), 7)) {
      std::cerr << "second acquire of the same file succeeded\n";
      return 1;
    }

    // Moving transfers ownership; the moved-from object releases nothing
    wtm::PortLock moved = std::move(*first);
    first.reset();
    if (!fs::exists(ports.lock_path(7)) || !moved.held()) {
      std::cerr << "lock lost on move\n";
      return 1;
    }
    moved.release();
    if (fs::exists(ports.lock_path(7))) {
      std::cerr << "release did not remove own lock\n";
      return 1;
    }

    // release() on a lock owned by someone else is a no-op
    std::ofstream(ports.lock_path(8)) << "999999999\n";
    if (ports.release(8) || !fs::exists(ports.lock_path(8))) {
      std::cerr << "released a foreign lock\n";
      return 1;
    }

    // release() twice is safe
    auto mine = ports.allocate(base / "no-worktrees");
    const int off = mine.offset();
    mine.persist();
    if (!ports.release(off)) {
      std::cerr << "release of own persisted lock failed\n";
      return 1;
    }
    if (ports.release(off)) {
      std::cerr << "second release reported a removal\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  std::cout << "lock OK\n";
  return 0;
}
