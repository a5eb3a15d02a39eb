#include "wtm/lock.hpp"

#include "wtm/fs.hpp"
#include "wtm/util.hpp"

#include <fstream>
#include <unistd.h>

namespace wtm {

std::string owner_token() { return std::to_string(::getpid()); }

bool remove_if_owned(const std::filesystem::path &path) noexcept {
  try {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
      return false;
    std::string content;
    std::getline(ifs, content);
    strutil::rstrip_newlines(content);
    if (content != owner_token())
      return false;
    std::error_code ec;
    return std::filesystem::remove(path, ec);
  } catch (const std::exception &) {
    return false;
  }
}

PortLock::PortLock(PortLock &&other) noexcept
    : path_(std::move(other.path_)), offset_(other.offset_), held_(other.held_) {
  other.held_ = false;
}

PortLock &PortLock::operator=(PortLock &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    offset_ = other.offset_;
    held_ = other.held_;
    other.held_ = false;
  }
  return *this;
}

std::optional<PortLock> PortLock::try_acquire(const std::filesystem::path &path, int offset) {
  if (!fs::create_exclusive(path, owner_token() + "\n"))
    return std::nullopt;
  return PortLock{path, offset};
}

void PortLock::release() noexcept {
  if (!held_)
    return;
  held_ = false;
  remove_if_owned(path_);
}

} // namespace wtm
