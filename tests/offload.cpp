#include "lfsync/dir_store.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/hash.hpp"
#include "lfsync/manifest.hpp"
#include "lfsync/offload.hpp"
#include "lfsync/pointer.hpp"
#include "lfsync/util.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

static constexpr std::uintmax_t kMiB = 1024 * 1024;

// Sparse file of the requested size.
static void make_sized(const fs::path &p, std::uintmax_t size) {
  testsupport::write_file(p, "");
  fs::resize_file(p, size);
}

int main() {
  testsupport::TempDir tmp("offload");
  const auto root = tmp.path() / "hist";
  const auto tag = std::string("large-files-v1");

  try {
    make_sized(root / "data" / "model.bin", 100 * kMiB);
    make_sized(root / "data" / "edge.bin", 60 * kMiB); // exactly the threshold: stays
    make_sized(root / "cache" / "big.bin", 70 * kMiB); // excluded
    testsupport::write_file(root / "notes.txt", "small");

    // Scanning
    const auto found = lfsync::scan_large_files(root, 60 * kMiB, {"cache"});
    if (found.size() != 1 || found[0] != root / "data" / "model.bin") {
      std::cerr << "scan should only report data/model.bin\n";
      return 1;
    }

    lfsync::DirStore dir(tmp.path() / "store");
    testsupport::CountingStore store(dir);
    lfsync::Manifest manifest(root / ".lfs" / "manifest.json", tag);
    manifest.load();
    testsupport::FakeVcs vcs(root);
    vcs.tracked.insert("data/model.bin");

    lfsync::OffloadEngine engine(store, manifest, &vcs, root,
                                 lfsync::OffloadOptions{.release_tag = tag,
                                                        .threshold = 60 * kMiB,
                                                        .excludes = {"cache"},
                                                        .workers = 2});

    const auto results = engine.offload_all();
    if (results.size() != 1 || !results.at("data/model.bin")) {
      std::cerr << "offload_all should succeed for data/model.bin only\n";
      return 1;
    }

    const auto ptr = lfsync::read_pointer(root / "data" / "model.bin.pointer");
    const auto hash = lfsync::hash_file(root / "data" / "model.bin");
    const auto expected_name = lfsync::asset_name_for(hash, "model.bin");
    if (ptr.size != 104857600 || ptr.hash != hash || ptr.asset_name != expected_name ||
        ptr.release_tag != tag || ptr.filename != "model.bin") {
      std::cerr << "pointer does not describe the offloaded file\n";
      return 1;
    }
    if (expected_name.size() != 12 + 1 + 9 || !expected_name.ends_with("-model.bin") ||
        expected_name.substr(0, 12) != std::string(lfsync::strip_hash_prefix(hash).substr(0, 12))) {
      std::cerr << "asset name should be <12 hex>-model.bin, got " << expected_name << "\n";
      return 1;
    }
    if (!lfsync::fs::exists(root / "data" / "model.bin")) {
      std::cerr << "the real file must stay on disk\n";
      return 1;
    }
    if (!lfsync::fs::exists(tmp.path() / "store" / tag / expected_name)) {
      std::cerr << "asset missing from the store\n";
      return 1;
    }
    const auto record = manifest.get_record("data/model.bin");
    if (!record || record->versions.size() != 1 || record->current_hash != hash) {
      std::cerr << "manifest should hold exactly one version\n";
      return 1;
    }
    if (vcs.unstaged != std::vector<std::string>{"data/model.bin"} ||
        !vcs.is_excluded("data/model.bin")) {
      std::cerr << "offloaded file should be unstaged and excluded from history\n";
      return 1;
    }
    if (store.uploads != 1 || engine.uploads() != 1) {
      std::cerr << "expected exactly one upload\n";
      return 1;
    }

    // A persisted manifest survives a reload.
    lfsync::Manifest reloaded(root / ".lfs" / "manifest.json", tag);
    reloaded.load();
    if (reloaded.get_all_versions("data/model.bin").size() != 1) {
      std::cerr << "manifest was not saved\n";
      return 1;
    }

    // Idempotent second pass
    (void)engine.offload_all();
    if (store.uploads != 1 || manifest.get_record("data/model.bin")->versions.size() != 1) {
      std::cerr << "unchanged content must not be uploaded again\n";
      return 1;
    }

    // An asset deleted from the store behind our back is uploaded again.
    {
      const auto container = dir.find_container(tag);
      const auto asset = container ? dir.find_asset(*container, expected_name) : std::nullopt;
      if (!asset) {
        std::cerr << "asset should be listed before deletion\n";
        return 1;
      }
      dir.delete_asset(*asset);
    }
    const auto healed = engine.offload_all();
    if (!healed.at("data/model.bin") || store.uploads != 2 ||
        !lfsync::fs::exists(tmp.path() / "store" / tag / expected_name)) {
      std::cerr << "a missing asset should be uploaded again\n";
      return 1;
    }
    if (manifest.get_record("data/model.bin")->versions.size() != 1) {
      std::cerr << "re-uploading known content must not add a version\n";
      return 1;
    }

    // Changed content becomes a second version; retention evicts the first.
    {
      std::fstream f(root / "data" / "model.bin", std::ios::in | std::ios::out | std::ios::binary);
      f.seekp(0);
      f.write("changed", 7);
    }
    (void)engine.offload(root / "data" / "model.bin");
    if (store.uploads != 3 || manifest.get_record("data/model.bin")->versions.size() != 2) {
      std::cerr << "changed content should add a version\n";
      return 1;
    }
    if (engine.cleanup(1) != 1 || store.deletes != 1 ||
        lfsync::fs::exists(tmp.path() / "store" / tag / expected_name)) {
      std::cerr << "retention should delete the evicted asset\n";
      return 1;
    }
    if (manifest.get_record("data/model.bin")->versions.size() != 1) {
      std::cerr << "retention should leave one version\n";
      return 1;
    }

    // Reverting to older content makes an old version current again. Retention
    // may drop it from the manifest but must keep the asset the pointer names.
    {
      const auto small_root = tmp.path() / "small";
      lfsync::DirStore small_dir(tmp.path() / "small-store");
      lfsync::Manifest small_manifest(small_root / ".lfs" / "manifest.json", tag);
      small_manifest.load();
      lfsync::OffloadEngine small(small_dir, small_manifest, nullptr, small_root,
                                  lfsync::OffloadOptions{.release_tag = tag, .threshold = 0});
      const auto file = small_root / "weights.bin";
      testsupport::write_file(file, "first weights");
      const auto first = small.offload(file);
      testsupport::write_file(file, "second weights");
      (void)small.offload(file);
      testsupport::write_file(file, "first weights");
      const auto reverted = small.offload(file);
      if (reverted.asset_name != first.asset_name ||
          small_manifest.get_record("weights.bin")->current_hash != first.hash) {
        std::cerr << "reverted content should point at the first asset\n";
        return 1;
      }
      (void)small.cleanup(1);
      if (!lfsync::fs::exists(tmp.path() / "small-store" / tag / first.asset_name)) {
        std::cerr << "retention deleted the asset of the current version\n";
        return 1;
      }
    }

    // Pointer files and offload bookkeeping are never candidates.
    for (const auto &p : lfsync::scan_large_files(root, 0, {})) {
      const auto rel = lfsync::fs::relative_generic(p, root);
      if (rel.ends_with(".pointer") || rel.starts_with(".lfs/")) {
        std::cerr << "scan returned bookkeeping file " << rel << "\n";
        return 1;
      }
    }

    // Missing source fails without side effects.
    try {
      (void)engine.offload(root / "nope.bin");
      std::cerr << "offloading a missing file should throw\n";
      return 1;
    } catch (const lfsync::Error &) {
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
