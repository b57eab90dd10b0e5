#include "lfsync/worktree.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/log.hpp"

#include <algorithm>

namespace stdfs = std::filesystem;

namespace lfsync::worktree {

std::vector<std::string> enumerate_files(
    const stdfs::path &root,
    const std::function<bool(const std::string &, const stdfs::directory_entry &)> &keep) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!stdfs::is_directory(root, ec))
    return out;

  stdfs::recursive_directory_iterator it(root, stdfs::directory_options::skip_permission_denied,
                                         ec);
  for (; !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    const auto &p = it->path();
    const auto name = p.filename().string();
    std::error_code sec;
    const auto st = it->symlink_status(sec);
    if (sec)
      continue;
    if (stdfs::is_directory(st)) {
      if (name == consts::kGitDir || name == consts::kLfsDir)
        it.disable_recursion_pending();
      continue;
    }
    if (!stdfs::is_regular_file(st))
      continue;
    auto rel = p.lexically_relative(root).generic_string();
    if (!keep || keep(rel, *it))
      out.push_back(std::move(rel));
  }
  if (ec)
    LOGW("walk of %s stopped early: %s", root.c_str(), ec.message().c_str());
  std::ranges::sort(out);
  return out;
}

std::vector<std::string> enumerate_files(const stdfs::path &root) {
  return enumerate_files(root, {});
}

} // namespace lfsync::worktree
