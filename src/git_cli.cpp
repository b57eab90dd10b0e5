#include "lfsync/git_cli.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"
#include "lfsync/util.hpp"

#include <fstream>
#include <set>

namespace stdfs = std::filesystem;

namespace {

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &a : args) {
    if (!out.empty())
      out += ' ';
    out += a;
  }
  return out;
}

std::string first_line(std::string s) {
  if (const auto nl = s.find('\n'); nl != std::string::npos)
    s.erase(nl);
  lfsync::strutil::rstrip_newlines(s);
  return s;
}

// Patterns with a leading '/' only match at the top of the work tree.
std::string anchored(std::string_view rel) {
  return "/" + lfsync::strutil::strip_slashes(rel);
}

} // namespace

namespace lfsync {

GitCli::GitCli(stdfs::path root, std::string git) : root_(std::move(root)), git_(std::move(git)) {}

ExecResult GitCli::run(const std::vector<std::string> &args) {
  std::vector<std::string> argv{git_};
  argv.insert(argv.end(), args.begin(), args.end());
  LOGD("git %s", mask_token(join_args(args)).c_str());
  return exec_command(argv, ExecOptions{.cwd = root_,
                                        .env = {{"GIT_TERMINAL_PROMPT", "0"},
                                                {"LC_ALL", "C"}}});
}

ExecResult GitCli::check(const std::vector<std::string> &args) {
  auto r = run(args);
  if (r.exit_code != 0) {
    std::string detail = r.err.empty() ? r.out : r.err;
    strutil::rstrip_newlines(detail);
    throw VcsError("git " + mask_token(join_args(args)), r.exit_code, mask_token(detail));
  }
  return r;
}

void GitCli::ensure_repo(const std::string &branch) {
  std::error_code ec;
  stdfs::create_directories(root_, ec);
  if (ec)
    throw VcsError("mkdir " + root_.string(), -1, ec.message());

  if (!fs::exists(root_ / consts::kGitDir)) {
    check({"init"});
    LOGI("Initialized repository in %s", root_.c_str());
  }
  // Works before the first commit too, unlike checkout.
  check({"symbolic-ref", "HEAD", "refs/heads/" + branch});

  if (run({"config", "user.name"}).exit_code != 0)
    check({"config", "user.name", "lfsync"});
  if (run({"config", "user.email"}).exit_code != 0)
    check({"config", "user.email", "lfsync@localhost"});
}

void GitCli::set_remote(const std::string &url) {
  const std::string name(consts::kRemoteName);
  if (run({"remote", "get-url", name}).exit_code == 0)
    check({"remote", "set-url", name, url});
  else
    check({"remote", "add", name, url});
}

bool GitCli::remote_is_empty(const std::string &branch) {
  const auto r = check({"ls-remote", "--heads", std::string(consts::kRemoteName)});
  if (strutil::trim(r.out).empty())
    return true;
  // Remote has other branches but not ours: treat our branch as new.
  return r.out.find("refs/heads/" + branch) == std::string::npos;
}

void GitCli::initial_commit_if_needed() {
  if (rev_parse("HEAD"))
    return;
  check({"add", "-A"});
  check({"commit", "--allow-empty", "-m", std::string(consts::kMsgInitial)});
  LOGI("Created initial commit");
}

void GitCli::fetch_and_reset(const std::string &branch) {
  const std::string remote(consts::kRemoteName);
  const std::string tracking = remote + "/" + branch;
  check({"fetch", remote, branch});
  check({"checkout", "-f", "-B", branch, tracking});
  check({"reset", "--hard", tracking});
}

void GitCli::pull_rebase(const std::string &branch) {
  const auto r = run({"pull", "--rebase", std::string(consts::kRemoteName), branch});
  if (r.exit_code != 0) {
    // Leave the tree usable for the next period.
    run({"rebase", "--abort"});
    std::string detail = r.err;
    strutil::rstrip_newlines(detail);
    throw VcsError("git pull --rebase", r.exit_code, mask_token(detail));
  }
}

bool GitCli::commit_all_if_dirty(const std::string &message) {
  check({"add", "-A"});
  const auto diff = run({"diff", "--cached", "--quiet"});
  if (diff.exit_code == 0)
    return false;
  if (diff.exit_code != 1)
    throw VcsError("git diff --cached --quiet", diff.exit_code, first_line(diff.err));
  check({"commit", "-m", message});
  return true;
}

void GitCli::push(const std::string &branch) {
  check({"push", std::string(consts::kRemoteName), branch});
}

std::optional<std::string> GitCli::rev_parse(const std::string &ref) {
  const auto r = run({"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
  if (r.exit_code != 0)
    return std::nullopt;
  auto id = strutil::trim(r.out);
  if (id.empty())
    return std::nullopt;
  return id;
}

bool GitCli::is_tracked(const std::string &rel) {
  return run({"ls-files", "--error-unmatch", "--", rel}).exit_code == 0;
}

void GitCli::unstage(const std::string &rel) {
  check({"rm", "--cached", "--quiet", "--", rel});
}

void GitCli::add_exclusions(const std::vector<std::string> &rels) {
  const std::lock_guard<std::mutex> lk(exclude_mu_);
  const stdfs::path file = root_ / consts::kGitDir / "info" / "exclude";

  std::set<std::string> existing;
  if (fs::exists(file)) {
    std::ifstream in(file);
    for (std::string line; std::getline(in, line);) {
      strutil::rstrip_newlines(line);
      existing.insert(line);
    }
  }

  std::vector<std::string> to_add;
  for (const auto &rel : rels) {
    if (strutil::trim(rel).empty())
      continue;
    auto pattern = anchored(strutil::trim(rel));
    if (existing.insert(pattern).second)
      to_add.push_back(std::move(pattern));
  }
  if (to_add.empty())
    return;

  fs::ensure_parent_dir(file);
  std::ofstream out(file, std::ios::app);
  for (const auto &p : to_add)
    out << p << '\n';
  out.close();
  if (!out)
    throw VcsError("update " + file.string(), -1, "write failed");
  LOGI("Updated git info/exclude with %zu entries", to_add.size());
}

} // namespace lfsync
