#include "lfsync/error.hpp"
#include "lfsync/pointer.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>

using testsupport::write_file;

static lfsync::PointerFile sample() {
  return lfsync::PointerFile{
      .version = 1,
      .hash = "sha256:" + std::string(64, 'a'),
      .size = 104857600,
      .filename = "model.bin",
      .release_tag = "large-files-v1",
      .asset_name = "aaaaaaaaaaaa-model.bin",
  };
}

static bool read_throws(const std::filesystem::path &p) {
  try {
    (void)lfsync::read_pointer(p);
  } catch (const lfsync::ParseError &) {
    return true;
  }
  return false;
}

int main() {
  testsupport::TempDir tmp("pointer");
  const auto root = tmp.path();

  try {
    // write + read
    const auto pp = root / "data" / "model.bin.pointer";
    lfsync::write_pointer(pp, sample());
    const auto back = lfsync::read_pointer(pp);
    if (back.hash != sample().hash || back.size != 104857600 || back.asset_name != sample().asset_name ||
        back.release_tag != "large-files-v1" || back.filename != "model.bin" || back.version != 1) {
      std::cerr << "pointer fields did not survive write/read\n";
      return 1;
    }
    if (testsupport::read_file(pp).find("\"type\": \"lfs-pointer\"") == std::string::npos) {
      std::cerr << "pointer document lacks the type discriminator\n";
      return 1;
    }

    // Recognition by suffix, and by content for small files
    write_file(root / "empty.pointer", "");
    if (!lfsync::is_pointer(root / "empty.pointer")) {
      std::cerr << "*.pointer should be recognized by name\n";
      return 1;
    }
    write_file(root / "marker.json", lfsync::format_pointer(sample()));
    if (!lfsync::is_pointer(root / "marker.json")) {
      std::cerr << "small lfs-pointer JSON should be recognized by content\n";
      return 1;
    }
    write_file(root / "other.json", R"({"type": "something-else"})");
    if (lfsync::is_pointer(root / "other.json")) {
      std::cerr << "foreign JSON must not be a pointer\n";
      return 1;
    }
    write_file(root / "big.json", lfsync::format_pointer(sample()) + std::string(4096, ' '));
    if (lfsync::is_pointer(root / "big.json")) {
      std::cerr << "files above 2 KiB are only pointers by name\n";
      return 1;
    }
    if (lfsync::is_pointer(root / "missing.pointer")) {
      std::cerr << "a missing file is not a pointer\n";
      return 1;
    }

    // Parse failures
    write_file(root / "bad1.pointer", "not json");
    write_file(root / "bad2.pointer", R"({"type": "nope", "hash": "sha256:x"})");
    write_file(root / "bad3.pointer",
               R"({"type": "lfs-pointer", "hash": "sha256:x", "size": 3, "filename": "f"})");
    write_file(root / "bad4.pointer", R"([1, 2, 3])");
    for (const char *name : {"bad1.pointer", "bad2.pointer", "bad3.pointer", "bad4.pointer"}) {
      if (!read_throws(root / name)) {
        std::cerr << "expected ParseError for " << name << "\n";
        return 1;
      }
    }

    // Validation gate
    if (!lfsync::validate(sample())) {
      std::cerr << "sample pointer should validate\n";
      return 1;
    }
    auto p = sample();
    p.hash = "md5:abc";
    if (lfsync::validate(p)) {
      std::cerr << "non-sha256 hash must fail validation\n";
      return 1;
    }
    p = sample();
    p.hash = "sha256:abc";
    if (lfsync::validate(p)) {
      std::cerr << "truncated digest must fail validation\n";
      return 1;
    }
    p = sample();
    p.size = 0;
    if (lfsync::validate(p)) {
      std::cerr << "zero size must fail validation\n";
      return 1;
    }
    p = sample();
    p.release_tag.clear();
    if (lfsync::validate(p)) {
      std::cerr << "empty release tag must fail validation\n";
      return 1;
    }

    // Path mapping
    if (lfsync::real_path_for(root / "a" / "x.bin.pointer") != root / "a" / "x.bin" ||
        lfsync::pointer_path_for(root / "a" / "x.bin") != root / "a" / "x.bin.pointer" ||
        lfsync::real_path_for(root / "marker.json") != root / "marker.json") {
      std::cerr << "pointer/real path mapping mismatch\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
