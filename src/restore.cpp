#include "lfsync/restore.hpp"

#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/hash.hpp"
#include "lfsync/log.hpp"
#include "lfsync/pointer.hpp"
#include "lfsync/thread_pool.hpp"
#include "lfsync/worktree.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <ranges>

namespace stdfs = std::filesystem;

namespace lfsync {

std::vector<stdfs::path> scan_pointer_files(const stdfs::path &root) {
  std::vector<stdfs::path> out;
  for (const auto &rel : worktree::enumerate_files(root)) {
    auto p = root / rel;
    if (is_pointer(p))
      out.push_back(std::move(p));
  }
  return out;
}

namespace {

bool has_content(const stdfs::path &p, const std::string &hash) {
  return fs::is_regular_file(p) && hash_file(p) == hash;
}

} // namespace

RestoreEngine::RestoreEngine(BlobStore &store, Manifest &manifest, VersionControl *vcs,
                             stdfs::path root, int workers)
    : store_(store), manifest_(manifest), vcs_(vcs), root_(std::move(root)),
      workers_(std::max(workers, 1)) {}

void RestoreEngine::restore(const stdfs::path &pointer_path, bool verify) {
  PointerFile pointer = read_pointer(pointer_path);
  if (!validate(pointer))
    throw ParseError("invalid pointer file: " + pointer_path.string());

  const stdfs::path dest = real_path_for(pointer_path);
  const std::string rel = fs::relative_generic(dest, root_);

  if (dest != pointer_path && has_content(dest, pointer.hash)) {
    LOGD("%s already present with the recorded hash", rel.c_str());
    if (vcs_ != nullptr)
      vcs_->add_exclusions({rel});
    return;
  }

  const auto container = store_.find_container(pointer.release_tag);
  if (!container)
    throw StoreError("container not found: " + pointer.release_tag, 404);

  auto asset = store_.find_asset(*container, pointer.asset_name);
  if (!asset) {
    for (const auto &v : manifest_.get_all_versions(rel)) {
      if (v.asset_name == pointer.asset_name)
        continue;
      asset = store_.find_asset(*container, v.asset_name);
      if (asset) {
        LOGW("Using fallback version %s for %s", v.asset_name.c_str(), rel.c_str());
        pointer.asset_name = v.asset_name;
        pointer.hash = v.hash;
        pointer.size = v.size;
        break;
      }
    }
    if (!asset)
      throw StoreError("asset not found: " + pointer.asset_name, 404);
  }

  const stdfs::path tmp = fs::temp_path_beside(dest);
  try {
    store_.download_asset(*asset, tmp);

    if (verify) {
      const std::string got = hash_file(tmp);
      if (got != pointer.hash)
        throw Error("hash mismatch for " + pointer.filename + ": expected " + pointer.hash +
                    ", got " + got);
    }

    if (dest != pointer_path && has_content(dest, pointer.hash)) {
      LOGI("File already exists with correct hash, skipping: %s", pointer.filename.c_str());
      fs::remove_quietly(tmp);
    } else {
      fs::replace_file(tmp, dest);
    }
  } catch (...) {
    fs::remove_quietly(tmp);
    throw;
  }

  if (vcs_ != nullptr)
    vcs_->add_exclusions({rel});
  LOGI("Restored %s (pointer kept)", rel.c_str());
}

std::map<std::string, bool> RestoreEngine::restore_paths(const std::vector<stdfs::path> &pointers,
                                                         bool verify, const Progress &progress) {
  std::map<std::string, bool> results;
  if (pointers.empty())
    return results;

  const std::size_t total = pointers.size();
  std::size_t completed = 0;
  std::mutex progress_mu;
  auto one = [&](const stdfs::path &p) {
    bool ok = false;
    try {
      restore(p, verify);
      ok = true;
    } catch (const std::exception &e) {
      LOGE("Failed to restore %s: %s", p.c_str(), e.what());
    }
    const std::lock_guard<std::mutex> lk(progress_mu);
    ++completed;
    if (progress)
      progress(completed, total);
    return ok;
  };

  // The pool's destructor joins before `one`'s captures go out of scope.
  ThreadPool pool(std::min(static_cast<std::size_t>(workers_), total));
  std::vector<std::pair<std::string, std::future<bool>>> pending;
  pending.reserve(total);
  for (const auto &p : pointers)
    pending.emplace_back(fs::relative_generic(p, root_), pool.submit([&one, p] { return one(p); }));

  for (auto &[rel, fut] : pending)
    results[rel] = fut.get();

  const auto ok = std::ranges::count(results | std::views::values, true);
  LOGI("Restore completed: %lld/%zu files", static_cast<long long>(ok), total);
  return results;
}

std::map<std::string, bool> RestoreEngine::restore_all(bool verify, const Progress &progress) {
  const auto pointers = scan_pointer_files(root_);
  if (pointers.empty()) {
    LOGI("No pointer files found");
    return {};
  }
  LOGI("Found %zu pointer files, restoring...", pointers.size());
  return restore_paths(pointers, verify, progress);
}

std::map<std::string, bool> RestoreEngine::restore_missing(bool verify,
                                                           const Progress &progress) {
  std::vector<stdfs::path> missing;
  for (auto &p : scan_pointer_files(root_)) {
    if (!fs::exists(real_path_for(p)))
      missing.push_back(std::move(p));
  }
  if (!missing.empty())
    LOGI("Restoring %zu files missing after pull", missing.size());
  return restore_paths(missing, verify, progress);
}

} // namespace lfsync
