#include "wtm/fs.hpp"

#include "wtm/error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace wtm::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::symlink_status(p, ec));
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

void ensure_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    throw Error(ErrorKind::Io, "mkdir -p failed: " + dir.string() + ": " + ec.message());
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.has_parent_path())
    ensure_dir(p.parent_path());
}

std::string read_text(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error(ErrorKind::Io, "open for read failed: " + p.string());
  }
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

std::optional<std::string> read_text_if_exists(const std::filesystem::path &p) {
  if (!wtm::fs::exists(p))
    return std::nullopt;
  return read_text(p);
}

std::filesystem::path write_temp(const std::filesystem::path &p, std::string_view data) {
  ensure_parent_dir(p);
  // pid suffix keeps concurrent writers of the same target apart
  auto tmp = p;
  tmp += ".tmp." + std::to_string(::getpid());
  std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw Error(ErrorKind::Io, "open temp for write failed: " + tmp.string());
  }
  if (!data.empty()) {
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  }
  ofs.flush();
  if (!ofs) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw Error(ErrorKind::Io, "flush temp failed: " + tmp.string());
  }
  return tmp;
}

void commit_temp(const std::filesystem::path &tmp, const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp, ignore);
    throw Error(ErrorKind::Io, "atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

void write_file_atomic(const std::filesystem::path &p, std::string_view data) {
  commit_temp(write_temp(p, data), p);
}

bool create_exclusive(const std::filesystem::path &p, std::string_view content) {
  const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd == -1) {
    if (errno == EEXIST)
      return false;
    throw Error(ErrorKind::Io, "create " + p.string() + " failed: " + std::strerror(errno));
  }
  std::size_t off = 0;
  while (off < content.size()) {
    const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const int err = errno;
      ::close(fd);
      ::unlink(p.c_str());
      throw Error(ErrorKind::Io, "write " + p.string() + " failed: " + std::strerror(err));
    }
    off += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

} // namespace wtm::fs
