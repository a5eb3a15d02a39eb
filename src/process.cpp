#include "wtm/process.hpp"

#include "wtm/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset() noexcept {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_{-1};
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char *const *argv, const char *cwd, int out_fd, bool quiet_stderr,
                             bool interactive) {
  if (cwd && ::chdir(cwd) != 0)
    ::_exit(126);
  const int devnull = ::open("/dev/null", O_RDWR);
  if (!interactive && devnull != -1)
    ::dup2(devnull, STDIN_FILENO);
  if (out_fd != -1)
    ::dup2(out_fd, STDOUT_FILENO);
  if (quiet_stderr && devnull != -1)
    ::dup2(devnull, STDERR_FILENO);
  ::execvp(argv[0], argv);
  ::_exit(127);
}

int wait_for(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

namespace wtm::process {

RunResult run(const std::vector<std::string> &argv, const RunOptions &opts) {
  if (argv.empty())
    throw Error(ErrorKind::Validation, "run: empty command line");

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  UniqueFd rd;
  UniqueFd wr;
  if (opts.capture) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
      throw Error(ErrorKind::Io, std::string("pipe failed: ") + std::strerror(errno));
    rd = UniqueFd{fds[0]};
    wr = UniqueFd{fds[1]};
  }

  const std::string cwd = opts.cwd.string();
  if (!cwd.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(opts.cwd, ec))
      throw Error(ErrorKind::NotFound, "working directory does not exist: " + cwd);
  }
  const pid_t pid = ::fork();
  if (pid < 0)
    throw Error(ErrorKind::Io, "fork failed for " + argv[0] + ": " + std::strerror(errno));
  if (pid == 0) {
    exec_child(cargv.data(), cwd.empty() ? nullptr : cwd.c_str(), wr.get(), opts.quiet_stderr,
               opts.interactive);
  }

  RunResult result;
  if (opts.capture) {
    wr.reset();
    char buf[4096];
    for (;;) {
      const ssize_t n = ::read(rd.get(), buf, sizeof(buf));
      if (n > 0) {
        result.output.append(buf, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        break;
      }
    }
  }
  result.exit_code = wait_for(pid);
  return result;
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string_view::npos) {
    const std::string p(name);
    if (::access(p.c_str(), X_OK) == 0)
      return std::filesystem::path(p);
    return std::nullopt;
  }
  const char *path_env = std::getenv("PATH");
  const std::string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t colon = path.find(':', start);
    if (colon == std::string_view::npos)
      colon = path.size();
    const std::string_view dir = path.substr(start, colon - start);
    const std::filesystem::path candidate =
        std::filesystem::path(dir.empty() ? "." : std::string(dir)) / std::string(name);
    std::error_code ec;
    if (::access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate, ec))
      return candidate;
    start = colon + 1;
  }
  return std::nullopt;
}

} // namespace wtm::process
