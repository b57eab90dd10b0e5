#include "lfsync/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string_view>
#include <sys/file.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char **environ;

namespace lfsync {

void UniqueFd::reset(int fd) noexcept {
  if (fd_ != fd && fd_ != -1)
    ::close(fd_);
  fd_ = fd;
}

std::optional<FileLock> FileLock::try_acquire(const std::filesystem::path &path) {
  std::error_code ec;
  if (path.has_parent_path())
    std::filesystem::create_directories(path.parent_path(), ec);
  if (ec)
    throw std::system_error(ec, "create " + path.parent_path().string());

  UniqueFd fd{::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
  if (!fd)
    throw std::system_error(errno, std::generic_category(), "open " + path.string());
  while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
    if (errno == EWOULDBLOCK)
      return std::nullopt;
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "flock " + path.string());
  }
  return FileLock{std::move(fd)};
}

namespace {

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

Pipe make_pipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");
  return Pipe{.read = UniqueFd{fds[0]}, .write = UniqueFd{fds[1]}};
}

// Environment for the child: ours, with `overrides` replacing or adding entries.
std::vector<std::string> child_environment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> out;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string_view entry{*e};
    const auto name = entry.substr(0, entry.find('='));
    bool replaced = false;
    for (const auto &[k, v] : overrides) {
      if (k == name) {
        replaced = true;
        break;
      }
    }
    if (!replaced)
      out.emplace_back(entry);
  }
  for (const auto &[k, v] : overrides)
    out.push_back(k + "=" + v);
  return out;
}

// Drain both pipes until EOF on each; poll() keeps a chatty stderr from
// blocking the child while we wait on stdout.
void drain(UniqueFd &out_fd, UniqueFd &err_fd, std::string &out, std::string &err) {
  char buf[4096];
  while (out_fd || err_fd) {
    pollfd fds[2];
    nfds_t n = 0;
    std::string *sinks[2];
    UniqueFd *owners[2];
    if (out_fd) {
      fds[n] = pollfd{.fd = out_fd.get(), .events = POLLIN, .revents = 0};
      sinks[n] = &out;
      owners[n++] = &out_fd;
    }
    if (err_fd) {
      fds[n] = pollfd{.fd = err_fd.get(), .events = POLLIN, .revents = 0};
      sinks[n] = &err;
      owners[n++] = &err_fd;
    }
    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    for (nfds_t i = 0; i < n; ++i) {
      if (fds[i].revents == 0)
        continue;
      const ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
      if (r > 0)
        sinks[i]->append(buf, static_cast<std::size_t>(r));
      else if (r == 0 || errno != EINTR)
        owners[i]->reset();
    }
  }
}

} // namespace

ExecResult exec_command(const std::vector<std::string> &args, const ExecOptions &opts) {
  if (args.empty())
    throw std::invalid_argument("exec_command: empty argument list");

  // Everything the child needs is built before fork().
  std::vector<char *> argv;
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);
  const auto env_strings = child_environment(opts.env);
  std::vector<char *> envp;
  for (const auto &e : env_strings)
    envp.push_back(const_cast<char *>(e.c_str()));
  envp.push_back(nullptr);
  const std::string cwd = opts.cwd.string();

  Pipe out = make_pipe();
  Pipe err = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "fork");

  if (pid == 0) {
    ::dup2(out.write.get(), STDOUT_FILENO);
    ::dup2(err.write.get(), STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      ::_exit(127);
    ::execvpe(argv[0], argv.data(), envp.data());
    ::_exit(127);
  }

  out.write.reset();
  err.write.reset();

  ExecResult result{.exit_code = -1, .out = {}, .err = {}};
  drain(out.read, err.read, result.out, result.err);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  return result;
}

} // namespace lfsync
