#include "lfsync/offload.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/hash.hpp"
#include "lfsync/log.hpp"
#include "lfsync/thread_pool.hpp"
#include "lfsync/util.hpp"
#include "lfsync/worktree.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace stdfs = std::filesystem;

namespace lfsync {

std::vector<stdfs::path> scan_large_files(const stdfs::path &root, std::uintmax_t threshold,
                                          const std::vector<std::string> &excludes) {
  const auto rels = worktree::enumerate_files(
      root, [&](const std::string &rel, const stdfs::directory_entry &entry) {
        if (rel.ends_with(consts::kPointerSuffix) || is_excluded(rel, excludes))
          return false;
        std::error_code ec;
        const auto size = entry.file_size(ec);
        return !ec && size > threshold;
      });
  std::vector<stdfs::path> out;
  out.reserve(rels.size());
  for (const auto &r : rels)
    out.push_back(root / r);
  return out;
}

OffloadEngine::OffloadEngine(BlobStore &store, Manifest &manifest, VersionControl *vcs,
                             stdfs::path root, OffloadOptions options)
    : store_(store), manifest_(manifest), vcs_(vcs), root_(std::move(root)),
      opts_(std::move(options)) {}

std::string OffloadEngine::rel(const stdfs::path &p) const {
  return fs::relative_generic(p, root_);
}

void OffloadEngine::untrack(const std::string &rel_path) {
  if (vcs_ == nullptr)
    return;
  const std::lock_guard<std::mutex> lk(vcs_mu_);
  try {
    if (vcs_->is_tracked(rel_path)) {
      vcs_->unstage(rel_path);
      LOGI("Removed %s from the index (file kept locally)", rel_path.c_str());
    }
  } catch (const VcsError &e) {
    LOGE("Failed to remove %s from the index: %s", rel_path.c_str(), e.what());
  }
}

PointerFile OffloadEngine::offload(const stdfs::path &file) {
  if (!fs::is_regular_file(file))
    throw Error("not a regular file: " + file.string());

  const std::string rel_path = rel(file);
  const std::string filename = file.filename().string();
  const std::uintmax_t size = stdfs::file_size(file);
  LOGD("Calculating hash for %s...", rel_path.c_str());
  const std::string hash = hash_file(file);
  const stdfs::path pointer_path = pointer_path_for(file);

  // Unchanged content that is already pointerized, recorded and stored: nothing to do.
  if (fs::exists(pointer_path)) {
    try {
      const auto existing = read_pointer(pointer_path);
      const auto current = manifest_.get_current_version(rel_path);
      if (existing.hash == hash && existing.size == size && current && current->hash == hash &&
          existing.release_tag == opts_.release_tag) {
        // The local record alone is not enough: the asset must still be in the store.
        const auto container = store_.find_container(opts_.release_tag);
        if (container && store_.find_asset(*container, existing.asset_name)) {
          LOGD("%s already offloaded", rel_path.c_str());
          if (vcs_ != nullptr)
            vcs_->add_exclusions({rel_path});
          return existing;
        }
        LOGW("Asset %s for %s is missing from the store, uploading again",
             existing.asset_name.c_str(), rel_path.c_str());
      }
    } catch (const ParseError &e) {
      LOGW("Rewriting unreadable pointer %s: %s", pointer_path.c_str(), e.what());
    }
  }

  const std::string wanted = asset_name_for(hash, filename);
  const Container container = store_.get_or_create_container(opts_.release_tag);

  std::string actual;
  if (auto existing = store_.find_asset(container, wanted)) {
    actual = existing->name;
    LOGI("Asset already exists: %s", actual.c_str());
  } else {
    LOGI("Uploading %s to %s...", filename.c_str(), opts_.release_tag.c_str());
    const Asset stored = store_.upload_asset(container, file, wanted);
    ++uploads_;
    actual = stored.name.empty() ? wanted : stored.name;
    if (actual != wanted)
      LOGI("Store renamed %s to %s", wanted.c_str(), actual.c_str());
  }

  const PointerFile pointer{.version = consts::kPointerVersion,
                            .hash = hash,
                            .size = size,
                            .filename = filename,
                            .release_tag = opts_.release_tag,
                            .asset_name = actual};
  write_pointer(pointer_path, pointer);

  untrack(rel_path);

  manifest_.add_version(rel_path, hash, actual, size);
  manifest_.save();

  if (vcs_ != nullptr)
    vcs_->add_exclusions({rel_path});

  LOGI("Offloaded %s (file kept, pointer created)", rel_path.c_str());
  return pointer;
}

std::map<std::string, bool> OffloadEngine::offload_paths(const std::vector<stdfs::path> &files) {
  std::map<std::string, bool> results;
  if (files.empty())
    return results;

  ThreadPool pool(static_cast<std::size_t>(std::max(opts_.workers, 1)));
  std::vector<std::pair<std::string, std::future<PointerFile>>> pending;
  pending.reserve(files.size());
  for (const auto &f : files)
    pending.emplace_back(rel(f), pool.submit([this, f] { return offload(f); }));

  for (auto &[rel_path, fut] : pending) {
    try {
      fut.get();
      results[rel_path] = true;
    } catch (const std::exception &e) {
      LOGE("Failed to offload %s: %s", rel_path.c_str(), e.what());
      results[rel_path] = false;
    }
  }
  return results;
}

std::map<std::string, bool> OffloadEngine::offload_all() {
  const auto files = scan_large_files(root_, opts_.threshold, opts_.excludes);
  if (!files.empty())
    LOGI("Found %zu large files (>%llu bytes)", files.size(),
         static_cast<unsigned long long>(opts_.threshold));
  return offload_paths(files);
}

std::size_t OffloadEngine::cleanup(int keep) {
  // Content that was re-offloaded keeps its first timestamp, so retention can
  // evict the version a pointer currently names. Its asset must survive.
  std::set<std::string> still_used;
  for (const auto &path : manifest_.list_files())
    if (const auto current = manifest_.get_current_version(path))
      still_used.insert(current->asset_name);

  const auto evicted = manifest_.cleanup_all_old_versions(keep);
  std::size_t deleted = 0;
  if (!evicted.empty()) {
    // Identical content under the same filename shares one asset.
    for (const auto &path : manifest_.list_files())
      for (const auto &v : manifest_.get_all_versions(path))
        still_used.insert(v.asset_name);

    const auto container = store_.find_container(opts_.release_tag);
    for (const auto &[path, names] : evicted) {
      for (const auto &name : names) {
        if (!container)
          break;
        if (still_used.contains(name)) {
          LOGD("Keeping asset %s of %s, still referenced", name.c_str(), path.c_str());
          continue;
        }
        try {
          if (auto asset = store_.find_asset(*container, name)) {
            store_.delete_asset(*asset);
            ++deleted;
          }
        } catch (const StoreError &e) {
          LOGE("Failed to delete old asset %s: %s", name.c_str(), e.what());
        }
      }
    }
  }
  manifest_.save();
  return deleted;
}

} // namespace lfsync
