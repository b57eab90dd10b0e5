#pragma once
#include "lfsync/process.hpp"
#include "lfsync/vcs.hpp"

#include <mutex>

namespace lfsync {

// VersionControl driving the `git` executable inside the history directory.
class GitCli : public VersionControl {
public:
  explicit GitCli(std::filesystem::path root, std::string git = "git");

  [[nodiscard]] auto root() const -> const std::filesystem::path & override { return root_; }

  void ensure_repo(const std::string &branch) override;
  void set_remote(const std::string &url) override;
  auto remote_is_empty(const std::string &branch) -> bool override;
  void initial_commit_if_needed() override;
  void fetch_and_reset(const std::string &branch) override;
  void pull_rebase(const std::string &branch) override;
  auto commit_all_if_dirty(const std::string &message) -> bool override;
  void push(const std::string &branch) override;
  auto rev_parse(const std::string &ref) -> std::optional<std::string> override;
  auto is_tracked(const std::string &rel) -> bool override;
  void unstage(const std::string &rel) override;
  void add_exclusions(const std::vector<std::string> &rels) override;

private:
  // Run git with `args`; returns the result without judging the exit code.
  auto run(const std::vector<std::string> &args) -> ExecResult;
  // Same, but a non-zero exit throws VcsError.
  auto check(const std::vector<std::string> &args) -> ExecResult;

  std::filesystem::path root_;
  std::string git_;
  std::mutex exclude_mu_;
};

} // namespace lfsync
