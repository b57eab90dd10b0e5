#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lfsync {

/**
 * The version-control tool behind the history directory, seen as a black box.
 *
 * Failing operations throw VcsError. Paths are relative to root().
 */
class VersionControl {
public:
  virtual ~VersionControl() = default;

  [[nodiscard]] virtual auto root() const -> const std::filesystem::path & = 0;

  // Create the repository if missing and make `branch` the current branch.
  virtual void ensure_repo(const std::string &branch) = 0;
  virtual void set_remote(const std::string &url) = 0;
  virtual auto remote_is_empty(const std::string &branch) -> bool = 0;
  // Commit (possibly empty) when the local branch has no commit yet.
  virtual void initial_commit_if_needed() = 0;
  // Fetch the remote branch and reset the local one onto it.
  virtual void fetch_and_reset(const std::string &branch) = 0;
  virtual void pull_rebase(const std::string &branch) = 0;
  // Stage everything; commit when anything is staged. Returns true on commit.
  virtual auto commit_all_if_dirty(const std::string &message) -> bool = 0;
  virtual void push(const std::string &branch) = 0;

  // Commit id `ref` resolves to, or std::nullopt.
  virtual auto rev_parse(const std::string &ref) -> std::optional<std::string> = 0;
  virtual auto is_tracked(const std::string &rel) -> bool = 0;
  // Remove from the index only; the working copy is untouched.
  virtual void unstage(const std::string &rel) = 0;
  // Keep paths out of history for good (idempotent).
  virtual void add_exclusions(const std::vector<std::string> &rels) = 0;
};

} // namespace lfsync
