#include "lfsync/fs.hpp"
#include "lfsync/linker.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using testsupport::read_file;
using testsupport::write_file;

static bool links_to(const fs::path &link, const fs::path &target) {
  return fs::is_symlink(fs::symlink_status(link)) && fs::read_symlink(link) == target;
}

int main() {
  testsupport::TempDir tmp("linker");
  const auto base = tmp.path() / "base";
  const auto hist = tmp.path() / "hist";

  try {
    // Live data under base
    write_file(base / "app" / "data" / "a.txt", "local a");
    write_file(base / "app" / "data" / "b.txt", "local b");
    fs::create_directories(base / "app" / "data" / "empty");
    fs::create_directories(base / "app" / "data" / "skip");
    write_file(base / "app" / "config.json", "local config");
    write_file(base / "app" / "solo.txt", "solo");

    // What the history clone already holds wins over local copies.
    write_file(hist / "app" / "data" / "a.txt", "history a");
    write_file(hist / "app" / "config.json", "history config");

    const std::vector<std::string> targets = {"app/data", "app/config.json", "app/solo.txt",
                                              "app/newdir/", "app/new.txt"};

    lfsync::linker::precreate_dirlike(hist, targets);
    if (!fs::is_directory(hist / "app" / "newdir")) {
      std::cerr << "directory targets should be pre-created in the history\n";
      return 1;
    }

    if (lfsync::linker::migrate_and_link(base, hist, targets) != targets.size()) {
      std::cerr << "every target should be linked\n";
      return 1;
    }
    for (const auto *rel : {"app/data", "app/config.json", "app/solo.txt", "app/newdir", "app/new.txt"}) {
      if (!links_to(base / rel, hist / rel)) {
        std::cerr << rel << " should be a symlink into the history\n";
        return 1;
      }
    }

    // Directory merge keeps history files and adds the missing ones.
    if (read_file(hist / "app" / "data" / "a.txt") != "history a" ||
        read_file(hist / "app" / "data" / "b.txt") != "local b" ||
        read_file(base / "app" / "data" / "b.txt") != "local b") {
      std::cerr << "directory merge differs\n";
      return 1;
    }
    // A file already in the history replaces the local one; a new one is moved.
    if (read_file(base / "app" / "config.json") != "history config" ||
        read_file(hist / "app" / "solo.txt") != "solo") {
      std::cerr << "file migration differs\n";
      return 1;
    }
    // Missing targets are created empty.
    if (!fs::is_directory(hist / "app" / "newdir") || !fs::is_regular_file(hist / "app" / "new.txt") ||
        fs::file_size(hist / "app" / "new.txt") != 0) {
      std::cerr << "missing targets should be created in the history\n";
      return 1;
    }

    // Linking again changes nothing.
    write_file(hist / "app" / "new.txt", "edited");
    if (lfsync::linker::migrate_and_link(base, hist, targets) != targets.size() ||
        read_file(base / "app" / "new.txt") != "edited" ||
        !links_to(base / "app" / "data", hist / "app" / "data")) {
      std::cerr << "a second link pass should leave existing links alone\n";
      return 1;
    }

    // A symlink pointing elsewhere is replaced.
    fs::remove(base / "app" / "solo.txt");
    fs::create_symlink(tmp.path() / "elsewhere", base / "app" / "solo.txt");
    lfsync::linker::ensure_symlink(base / "app" / "solo.txt", hist / "app" / "solo.txt");
    if (!links_to(base / "app" / "solo.txt", hist / "app" / "solo.txt")) {
      std::cerr << "stale symlink should be repointed\n";
      return 1;
    }

    // Empty directories get a .gitkeep, except excluded ones.
    const std::vector<std::string> excludes = {"app/data/skip"};
    const auto kept = lfsync::linker::track_empty_dirs(hist, targets, excludes);
    if (kept != 2 || !fs::exists(hist / "app" / "data" / "empty" / ".gitkeep") ||
        !fs::exists(hist / "app" / "newdir" / ".gitkeep") ||
        fs::exists(hist / "app" / "data" / "skip" / ".gitkeep")) {
      std::cerr << "expected .gitkeep in the two empty directories, got " << kept << "\n";
      return 1;
    }
    if (lfsync::linker::track_empty_dirs(hist, targets, excludes) != 0) {
      std::cerr << "directories holding a .gitkeep are no longer empty\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
