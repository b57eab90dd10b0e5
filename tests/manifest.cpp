#include "lfsync/manifest.hpp"
#include "test_support.hpp"

#include <ctime>
#include <iostream>
#include <string>

static std::string hash_of(char c) { return "sha256:" + std::string(64, c); }

int main() {
  testsupport::TempDir tmp("manifest");
  const auto path = tmp.path() / ".lfs" / "manifest.json";

  // Deterministic clock: one second per call.
  std::time_t now = 1700000000;
  auto clock = [&now] { return now++; };

  try {
    lfsync::Manifest m(path, "large-files-v1", clock);
    m.load();
    if (m.size() != 0) {
      std::cerr << "missing manifest should load empty\n";
      return 1;
    }

    // Dedup by hash
    if (!m.add_version("data/model.bin", hash_of('a'), "aaaaaaaaaaaa-model.bin", 10)) {
      std::cerr << "first version should be appended\n";
      return 1;
    }
    if (m.add_version("data/model.bin", hash_of('a'), "aaaaaaaaaaaa-model.bin", 10)) {
      std::cerr << "identical hash must not add a version\n";
      return 1;
    }
    if (m.get_record("data/model.bin")->versions.size() != 1) {
      std::cerr << "expected exactly one version after duplicate add\n";
      return 1;
    }

    // Retention: N = 3, k = 2 more distinct contents
    const std::string chars = "bcde";
    for (char c : chars)
      m.add_version("data/model.bin", hash_of(c), std::string(12, c) + "-model.bin", 10);
    const auto all = m.get_all_versions("data/model.bin");
    if (all.size() != 5 || all.front().hash != hash_of('e') || all.back().hash != hash_of('a')) {
      std::cerr << "get_all_versions should list newest first\n";
      return 1;
    }
    const auto evicted = m.cleanup_old_versions("data/model.bin", 3);
    if (evicted.size() != 2 || evicted[0] != "bbbbbbbbbbbb-model.bin" ||
        evicted[1] != "aaaaaaaaaaaa-model.bin") {
      std::cerr << "expected the two oldest assets to be evicted\n";
      return 1;
    }
    const auto rec = m.get_record("data/model.bin");
    if (rec->versions.size() != 3 || rec->versions[0].hash != hash_of('c') ||
        rec->current_hash != hash_of('e')) {
      std::cerr << "survivors should be the 3 newest in append order\n";
      return 1;
    }

    // Equal timestamps: append order decides
    std::time_t frozen = 1800000000;
    lfsync::Manifest same_second(tmp.path() / "other.json", "t", [&frozen] { return frozen; });
    same_second.add_version("x", hash_of('1'), "one", 1);
    same_second.add_version("x", hash_of('2'), "two", 1);
    same_second.add_version("x", hash_of('3'), "three", 1);
    const auto gone = same_second.cleanup_old_versions("x", 1);
    if (gone.size() != 2 || same_second.get_current_version("x")->asset_name != "three") {
      std::cerr << "ties should keep the most recently appended version\n";
      return 1;
    }

    // Stale current_hash falls back to the newest entry
    m.add_version("data/old.bin", hash_of('f'), "f-asset", 5);
    m.add_version("data/old.bin", hash_of('9'), "9-asset", 5, /*set_current=*/false);
    if (m.get_current_version("data/old.bin")->asset_name != "f-asset") {
      std::cerr << "current version should follow current_hash\n";
      return 1;
    }
    m.cleanup_old_versions("data/old.bin", 1);
    const auto cur = m.get_current_version("data/old.bin");
    if (!cur || cur->asset_name != "9-asset") {
      std::cerr << "expected fallback to the newest remaining version\n";
      return 1;
    }

    // Persist and reload
    m.save();
    lfsync::Manifest reloaded(path, "large-files-v1");
    reloaded.load();
    if (reloaded.size() != 2 || reloaded.get_record("data/model.bin")->versions.size() != 3) {
      std::cerr << "reloaded manifest differs\n";
      return 1;
    }
    if (reloaded.get_all_versions("data/model.bin").front().hash != hash_of('e')) {
      std::cerr << "reloaded ordering differs\n";
      return 1;
    }

    // cleanup_all_old_versions and remove_file
    const auto per_path = reloaded.cleanup_all_old_versions(1);
    if (per_path.size() != 1 || per_path.at("data/model.bin").size() != 2) {
      std::cerr << "cleanup_all_old_versions should report only paths with evictions\n";
      return 1;
    }
    if (reloaded.remove_file("data/model.bin").size() != 1 || reloaded.size() != 1) {
      std::cerr << "remove_file should drop the record and return its assets\n";
      return 1;
    }

    // Corrupt document degrades to empty
    testsupport::write_file(path, "{ this is not json");
    lfsync::Manifest corrupt(path, "large-files-v1");
    corrupt.load();
    if (corrupt.size() != 0) {
      std::cerr << "corrupt manifest should load empty\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
