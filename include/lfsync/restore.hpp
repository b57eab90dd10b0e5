#pragma once
#include "lfsync/blob_store.hpp"
#include "lfsync/manifest.hpp"
#include "lfsync/vcs.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lfsync {

// Every pointer file under root (see is_pointer), skipping .git and .lfs.
auto scan_pointer_files(const std::filesystem::path &root) -> std::vector<std::filesystem::path>;

/**
 * Rehydrates real files from pointer files.
 *
 * A pointer whose asset has been evicted from the store falls back to older
 * versions recorded in the manifest, newest first. Downloads land in a temp
 * file beside the destination and are renamed into place; the pointer stays.
 */
class RestoreEngine {
public:
  // (completed, total) after each pointer of a batch finishes.
  using Progress = std::function<void(std::size_t, std::size_t)>;

  RestoreEngine(BlobStore &store, Manifest &manifest, VersionControl *vcs,
                std::filesystem::path root, int workers = 3);

  // Restore one pointer. Throws ParseError for an invalid pointer,
  // StoreError when nothing can be fetched, Error on a hash mismatch.
  void restore(const std::filesystem::path &pointer_path, bool verify);

  // Restore every pointer under root on the worker pool.
  auto restore_all(bool verify, const Progress &progress = {}) -> std::map<std::string, bool>;
  // Only pointers whose real file is missing (e.g. removed by a rebase).
  auto restore_missing(bool verify, const Progress &progress = {}) -> std::map<std::string, bool>;
  // Explicit pointer list; results are keyed by root-relative pointer path.
  auto restore_paths(const std::vector<std::filesystem::path> &pointers, bool verify,
                     const Progress &progress = {}) -> std::map<std::string, bool>;

private:
  BlobStore &store_;
  Manifest &manifest_;
  VersionControl *vcs_;
  std::filesystem::path root_;
  int workers_;
};

} // namespace lfsync
