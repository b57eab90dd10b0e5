#include "lfsync/linker.hpp"

#include "lfsync/config.hpp"
#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"
#include "lfsync/util.hpp"

#include <set>

namespace stdfs = std::filesystem;

namespace {

std::string without_trailing_slash(std::string rel) {
  while (rel.size() > 1 && rel.back() == '/')
    rel.pop_back();
  return rel;
}

bool present(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(stdfs::symlink_status(p, ec));
}

// Copy src into dst; files and links already in dst win.
void merge_tree(const stdfs::path &src, const stdfs::path &dst) {
  stdfs::create_directories(dst);
  for (stdfs::recursive_directory_iterator it(src), end; it != end; ++it) {
    const auto to = dst / it->path().lexically_relative(src);
    const auto st = it->symlink_status();
    if (stdfs::is_directory(st)) {
      stdfs::create_directories(to);
      continue;
    }
    if (present(to))
      continue;
    if (stdfs::is_symlink(st))
      stdfs::copy_symlink(it->path(), to);
    else if (stdfs::is_regular_file(st))
      stdfs::copy_file(it->path(), to);
  }
}

void move_file(const stdfs::path &src, const stdfs::path &dst) {
  std::error_code ec;
  stdfs::rename(src, dst, ec);
  if (ec == std::errc::cross_device_link) {
    stdfs::copy_file(src, dst);
    stdfs::remove(src);
  } else if (ec) {
    throw stdfs::filesystem_error("move", src, dst, ec);
  }
}

void migrate_one(const stdfs::path &base, const stdfs::path &hist, const std::string &rel) {
  const bool dir_like = rel.ends_with('/');
  const std::string clean = without_trailing_slash(rel);
  const auto src = lfsync::to_abs_under_base(base, clean);
  const auto dst = lfsync::to_under_hist(hist, clean);
  if (dst == hist)
    throw lfsync::ConfigError("target maps onto the history root: " + rel);
  stdfs::create_directories(dst.parent_path());

  const auto st = stdfs::symlink_status(src);
  if (stdfs::is_symlink(st)) {
    // already linked, possibly to an older location
  } else if (stdfs::is_directory(st)) {
    merge_tree(src, dst);
    stdfs::remove_all(src);
  } else if (stdfs::exists(st)) {
    if (!present(dst))
      move_file(src, dst);
    else
      stdfs::remove(src);
  } else if (dir_like) {
    stdfs::create_directories(dst);
  } else if (!present(dst)) {
    lfsync::fs::write_text_atomic(dst, "");
  }
  lfsync::linker::ensure_symlink(src, dst);
}

} // namespace

namespace lfsync::linker {

void ensure_symlink(const stdfs::path &link, const stdfs::path &target) {
  fs::ensure_parent_dir(link);
  const auto st = stdfs::symlink_status(link);
  if (stdfs::is_symlink(st)) {
    if (stdfs::read_symlink(link) == target)
      return;
    stdfs::remove(link);
  } else if (stdfs::exists(st)) {
    stdfs::remove_all(link);
  }
  stdfs::create_symlink(target, link);
}

void precreate_dirlike(const stdfs::path &hist, const std::vector<std::string> &targets) {
  for (const auto &rel : targets) {
    const auto dst = to_under_hist(hist, without_trailing_slash(rel));
    stdfs::create_directories(rel.ends_with('/') ? dst : dst.parent_path());
  }
}

std::size_t migrate_and_link(const stdfs::path &base, const stdfs::path &hist,
                             const std::vector<std::string> &targets) {
  std::size_t linked = 0;
  for (const auto &rel : targets) {
    if (strutil::trim(rel).empty())
      continue;
    try {
      migrate_one(base, hist, rel);
      ++linked;
    } catch (const std::exception &e) {
      LOGE("Failed to link %s: %s", rel.c_str(), e.what());
    }
  }
  LOGI("Linked %zu of %zu targets into %s", linked, targets.size(), hist.c_str());
  return linked;
}

std::size_t track_empty_dirs(const stdfs::path &hist, const std::vector<std::string> &targets,
                             const std::vector<std::string> &excludes) {
  std::set<stdfs::path> dirs;
  for (const auto &rel : targets) {
    const auto root = to_under_hist(hist, without_trailing_slash(rel));
    std::error_code ec;
    if (!stdfs::is_directory(stdfs::symlink_status(root, ec)))
      continue;
    dirs.insert(root);
    stdfs::recursive_directory_iterator it(root, stdfs::directory_options::skip_permission_denied,
                                           ec);
    for (; !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code sec;
      if (!stdfs::is_directory(it->symlink_status(sec)))
        continue;
      const auto name = it->path().filename().string();
      if (name == consts::kGitDir || name == consts::kLfsDir) {
        it.disable_recursion_pending();
        continue;
      }
      dirs.insert(it->path());
    }
    if (ec)
      LOGW("walk of %s stopped early: %s", root.c_str(), ec.message().c_str());
  }

  std::size_t written = 0;
  for (const auto &dir : dirs) {
    if (is_excluded(fs::relative_generic(dir, hist), excludes))
      continue;
    std::error_code ec;
    if (!stdfs::is_empty(dir, ec) || ec)
      continue;
    fs::write_text_atomic(dir / consts::kGitKeep, "");
    ++written;
  }
  if (written > 0)
    LOGI("Tracked %zu empty directories", written);
  return written;
}

} // namespace lfsync::linker
