#pragma once
#include "lfsync/blob_store.hpp"
#include "lfsync/manifest.hpp"
#include "lfsync/pointer.hpp"
#include "lfsync/vcs.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lfsync {

// Regular files under root strictly larger than `threshold`, excluding
// .git/.lfs, "*.pointer" files and paths under an `excludes` prefix.
auto scan_large_files(const std::filesystem::path &root, std::uintmax_t threshold,
                      const std::vector<std::string> &excludes) -> std::vector<std::filesystem::path>;

struct OffloadOptions {
  std::string release_tag;
  std::uintmax_t threshold;
  std::vector<std::string> excludes;
  int workers{1};
};

/**
 * Moves oversized files out of history: hash, upload once per content,
 * write "<file>.pointer", drop the file from the index and record the version.
 * The real file always stays on disk.
 *
 * `vcs` may be null, in which case index and exclusion bookkeeping is skipped.
 */
class OffloadEngine {
public:
  OffloadEngine(BlobStore &store, Manifest &manifest, VersionControl *vcs,
                std::filesystem::path root, OffloadOptions options);

  // Offload one file. Throws on any failure; the file is left untouched.
  auto offload(const std::filesystem::path &file) -> PointerFile;

  // scan_large_files + offload each; per-file failures are logged.
  // Returns root-relative path -> success.
  auto offload_all() -> std::map<std::string, bool>;
  auto offload_paths(const std::vector<std::filesystem::path> &files)
      -> std::map<std::string, bool>;

  // Retention: keep `keep` versions per path, delete the evicted assets from
  // the store and persist the manifest. Returns the number of assets deleted.
  auto cleanup(int keep) -> std::size_t;

  [[nodiscard]] auto uploads() const noexcept -> std::size_t { return uploads_; }

private:
  auto rel(const std::filesystem::path &p) const -> std::string;
  void untrack(const std::string &rel_path);

  BlobStore &store_;
  Manifest &manifest_;
  VersionControl *vcs_;
  std::filesystem::path root_;
  OffloadOptions opts_;

  std::mutex vcs_mu_; // the VCS index admits one writer
  std::atomic<std::size_t> uploads_{0};
};

} // namespace lfsync
