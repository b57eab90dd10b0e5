#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lfsync {

// Owning file descriptor; closes on destruction.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      reset(other.fd_);
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept;

private:
  int fd_{-1};
};

// Exclusive advisory lock (flock) on a file, held for the object's lifetime.
// Serializes lfsync processes working on the same history clone.
class FileLock {
public:
  // Creates the file and its directory if needed. std::nullopt when another
  // holder has it; throws std::system_error on any other failure.
  static auto try_acquire(const std::filesystem::path &path) -> std::optional<FileLock>;

private:
  explicit FileLock(UniqueFd fd) noexcept : fd_{std::move(fd)} {}

  UniqueFd fd_; // closing the descriptor releases the lock
};

struct ExecResult {
  int exit_code; // -1 when killed by a signal
  std::string out;
  std::string err;
};

struct ExecOptions {
  std::filesystem::path cwd;                              // empty: inherit
  std::vector<std::pair<std::string, std::string>> env;   // added/overridden variables
};

// fork/exec `args` (PATH lookup for args[0]) and collect stdout/stderr.
// Throws std::system_error when the process cannot be started; a non-zero
// exit is reported through ExecResult, not thrown.
auto exec_command(const std::vector<std::string> &args, const ExecOptions &opts = {})
    -> ExecResult;

} // namespace lfsync
