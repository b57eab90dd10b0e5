#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace lfsync {

struct ProgressSnapshot {
  std::string stage; // "starting", "git", "linking", "lfs_download", "complete"
  int percent;
  std::optional<std::size_t> current;
  std::optional<std::size_t> total;
};

// Publishes startup progress for status pages and downstream services.
// Write failures are logged, never thrown.
class ProgressReporter {
public:
  ProgressReporter(std::filesystem::path progress_file, std::filesystem::path complete_file);

  void write(const ProgressSnapshot &snapshot);

  // Stamp the completion marker (epoch seconds) and report stage "complete".
  void mark_complete();

  // Last snapshot on disk, if readable.
  [[nodiscard]] auto read() const -> std::optional<ProgressSnapshot>;
  [[nodiscard]] auto complete() const -> bool;

private:
  std::filesystem::path progress_file_;
  std::filesystem::path complete_file_;
};

} // namespace lfsync
