#include "lfsync/git_cli.hpp"
#include "lfsync/process.hpp"
#include "test_support.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;
using testsupport::read_file;
using testsupport::write_file;

static bool git_available() {
  try {
    return lfsync::exec_command({"git", "--version"}).exit_code == 0;
  } catch (const std::system_error &) {
    return false;
  }
}

int main() {
  if (!git_available()) {
    std::cerr << "git not found, skipping\n";
    return 0;
  }

  testsupport::TempDir tmp("git_cli");
  const auto remote = tmp.path() / "remote.git";
  const std::string branch = "main";

  try {
    // process plumbing
    const auto echo = lfsync::exec_command({"sh", "-c", "printf out; printf err >&2; exit 3"});
    if (echo.exit_code != 3 || echo.out != "out" || echo.err != "err") {
      std::cerr << "exec_command should capture both streams and the exit code\n";
      return 1;
    }
    const auto env = lfsync::exec_command({"sh", "-c", "printf %s \"$LFSYNC_CHILD_VAR\""},
                                          {.cwd = tmp.path(), .env = {{"LFSYNC_CHILD_VAR", "set"}}});
    if (env.out != "set") {
      std::cerr << "environment overrides were not passed to the child\n";
      return 1;
    }

    fs::create_directories(remote);
    if (lfsync::exec_command({"git", "init", "--bare", "-q"}, {.cwd = remote, .env = {}}).exit_code != 0) {
      std::cerr << "could not create the bare remote\n";
      return 1;
    }

    // First clone seeds the empty remote.
    lfsync::GitCli a(tmp.path() / "a");
    a.ensure_repo(branch);
    a.set_remote(remote.string());
    a.set_remote(remote.string()); // second call updates in place
    if (!a.remote_is_empty(branch) || a.rev_parse("HEAD")) {
      std::cerr << "fresh remote should be empty and HEAD unborn\n";
      return 1;
    }
    a.initial_commit_if_needed();
    a.push(branch);
    if (a.remote_is_empty(branch) || a.rev_parse("HEAD") != a.rev_parse("origin/main")) {
      std::cerr << "after the initial push HEAD should match origin/main\n";
      return 1;
    }

    write_file(a.root() / "notes.txt", "hello\n");
    if (!a.commit_all_if_dirty("add notes") || a.commit_all_if_dirty("nothing")) {
      std::cerr << "commit_all_if_dirty should commit once\n";
      return 1;
    }
    a.push(branch);

    // Dropping a file from history while keeping it on disk.
    write_file(a.root() / "big.bin", "large payload");
    (void)a.commit_all_if_dirty("add big");
    if (!a.is_tracked("big.bin")) {
      std::cerr << "big.bin should be tracked\n";
      return 1;
    }
    a.add_exclusions({"big.bin"});
    a.add_exclusions({"big.bin", ""});
    a.unstage("big.bin");
    if (!a.commit_all_if_dirty("drop big") || a.is_tracked("big.bin") ||
        !fs::exists(a.root() / "big.bin")) {
      std::cerr << "unstaged file should leave history and stay on disk\n";
      return 1;
    }
    if (a.commit_all_if_dirty("again")) {
      std::cerr << "excluded file must not be re-added\n";
      return 1;
    }
    if (read_file(a.root() / ".git" / "info" / "exclude").find("/big.bin\n/big.bin") !=
        std::string::npos) {
      std::cerr << "exclusions should be appended once\n";
      return 1;
    }
    a.push(branch);

    // Second clone aligns by fetch + reset.
    lfsync::GitCli b(tmp.path() / "b");
    b.ensure_repo(branch);
    b.set_remote(remote.string());
    if (b.remote_is_empty(branch)) {
      std::cerr << "remote should have the branch now\n";
      return 1;
    }
    b.fetch_and_reset(branch);
    if (b.rev_parse("HEAD") != a.rev_parse("HEAD") || read_file(b.root() / "notes.txt") != "hello\n" ||
        fs::exists(b.root() / "big.bin")) {
      std::cerr << "second clone should match the remote\n";
      return 1;
    }

    // Divergent commits are reconciled by pull --rebase.
    write_file(a.root() / "from_a.txt", "a\n");
    (void)a.commit_all_if_dirty("from a");
    a.push(branch);
    write_file(b.root() / "from_b.txt", "b\n");
    (void)b.commit_all_if_dirty("from b");
    b.pull_rebase(branch);
    b.push(branch);
    if (!fs::exists(b.root() / "from_a.txt") || b.rev_parse("HEAD") != b.rev_parse("origin/main")) {
      std::cerr << "rebase should bring in the other clone's commit\n";
      return 1;
    }

    // Rejected push surfaces as VcsError.
    write_file(a.root() / "late.txt", "late\n");
    (void)a.commit_all_if_dirty("late");
    try {
      a.push(branch);
      std::cerr << "non-fast-forward push should fail\n";
      return 1;
    } catch (const lfsync::VcsError &e) {
      if (e.exit_code() == 0) {
        std::cerr << "VcsError should carry the exit code\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
