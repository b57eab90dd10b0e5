#include "lfsync/dir_store.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>

using testsupport::read_file;
using testsupport::write_file;

int main() {
  testsupport::TempDir tmp("dir_store");
  const auto root = tmp.path();
  lfsync::DirStore store(root / "store");

  try {
    if (store.find_container("large-files-v1")) {
      std::cerr << "container should not exist yet\n";
      return 1;
    }
    const auto c = store.get_or_create_container("large-files-v1");
    const auto again = store.get_or_create_container("large-files-v1");
    if (c.tag != "large-files-v1" || again.id != c.id) {
      std::cerr << "get_or_create_container should be idempotent\n";
      return 1;
    }

    write_file(root / "src" / "blob.bin", "first payload");
    std::uintmax_t last_done = 0;
    const auto a = store.upload_asset(c, root / "src" / "blob.bin", "abc123-blob.bin",
                                      [&](std::uintmax_t done, std::uintmax_t) { last_done = done; });
    if (a.name != "abc123-blob.bin" || a.size != 13 || last_done != 13) {
      std::cerr << "upload should report the stored name, size and progress\n";
      return 1;
    }

    // Same name replaces the earlier asset.
    write_file(root / "src" / "blob.bin", "second");
    (void)store.upload_asset(c, root / "src" / "blob.bin", "abc123-blob.bin");
    const auto listed = store.list_assets(c);
    if (listed.size() != 1 || listed[0].size != 6) {
      std::cerr << "re-upload under the same name should replace the asset\n";
      return 1;
    }

    const auto found = store.find_asset(c, "abc123-blob.bin");
    if (!found || store.find_asset(c, "nope")) {
      std::cerr << "find_asset mismatch\n";
      return 1;
    }
    store.download_asset(*found, root / "out" / "blob.bin");
    if (read_file(root / "out" / "blob.bin") != "second") {
      std::cerr << "downloaded payload differs\n";
      return 1;
    }

    // Names that would leave the container directory are refused.
    write_file(root / "outside.bin", "not an asset");
    for (const std::string bad : {"../outside.bin", "sub/blob.bin", ".."}) {
      try {
        (void)store.find_asset(c, bad);
        std::cerr << "find_asset accepted " << bad << "\n";
        return 1;
      } catch (const lfsync::StoreError &e) {
        if (e.status() != 400 || e.transient()) {
          std::cerr << "expected a permanent 400 for " << bad << "\n";
          return 1;
        }
      }
    }
    if (store.find_asset(c, "abc123-v1..final.bin")) {
      std::cerr << "inner dots are part of a plain name\n";
      return 1;
    }
    try {
      (void)store.upload_asset(c, root / "src" / "blob.bin", "../escaped.bin");
      std::cerr << "upload_asset accepted a name with ..\n";
      return 1;
    } catch (const lfsync::StoreError &) {
    }
    if (lfsync::fs::exists(root / "store" / "escaped.bin") || !lfsync::fs::exists(root / "outside.bin")) {
      std::cerr << "a rejected name must not touch the filesystem\n";
      return 1;
    }

    store.delete_asset(*found);
    if (!store.list_assets(c).empty()) {
      std::cerr << "asset should be gone after delete\n";
      return 1;
    }
    try {
      store.download_asset(*found, root / "out" / "gone.bin");
      std::cerr << "downloading a deleted asset should fail\n";
      return 1;
    } catch (const lfsync::StoreError &e) {
      if (!e.not_found()) {
        std::cerr << "expected a 404 StoreError, got " << e.status() << "\n";
        return 1;
      }
    }
    if (lfsync::fs::exists(root / "out" / "gone.bin")) {
      std::cerr << "failed download must not leave a destination file\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
