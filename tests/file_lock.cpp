#include "lfsync/process.hpp"
#include "test_support.hpp"

#include <iostream>

int main() {
  testsupport::TempDir tmp("file_lock");
  const auto path = tmp.path() / "hist" / ".lfs" / "lfsync.lock";

  try {
    auto held = lfsync::FileLock::try_acquire(path);
    if (!held || !std::filesystem::exists(path)) {
      std::cerr << "first holder should get the lock and create the file\n";
      return 1;
    }

    // A second open of the same file contends like another process would.
    if (lfsync::FileLock::try_acquire(path)) {
      std::cerr << "lock must not be granted twice\n";
      return 1;
    }

    // Moving the holder keeps the lock.
    auto moved = std::move(held);
    held.reset();
    if (lfsync::FileLock::try_acquire(path)) {
      std::cerr << "moved-from holder released the lock\n";
      return 1;
    }

    moved.reset();
    if (!lfsync::FileLock::try_acquire(path)) {
      std::cerr << "lock should be free once the holder is gone\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
