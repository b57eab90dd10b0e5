#include "cli/context.hpp"

#include "lfsync/pointer.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_restore(int argc, char **argv) {
  bool verify = true;
  std::vector<std::filesystem::path> pointers;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--no-verify") {
      verify = false;
      continue;
    }
    auto p = std::filesystem::absolute(a).lexically_normal();
    if (!p.filename().string().ends_with(".pointer") && !lfsync::is_pointer(p))
      p = lfsync::pointer_path_for(p);
    pointers.push_back(std::move(p));
  }

  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/false, /*exclusive=*/true);
    if (!ctx.restore) {
      std::cerr << "restore: no blob store configured (LFS_ENABLED, GITHUB_PAT or LFS_STORE_URL)\n";
      return 1;
    }
    verify = verify && ctx.settings.lfs_verify_hash;

    const auto results = pointers.empty() ? ctx.restore->restore_all(verify)
                                          : ctx.restore->restore_paths(pointers, verify);
    int failed = 0;
    for (const auto &[path, ok] : results) {
      std::cout << (ok ? "restored  " : "FAILED    ") << path << "\n";
      failed += ok ? 0 : 1;
    }
    if (results.empty())
      std::cout << "No pointer files found\n";
    return failed == 0 ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "restore: " << e.what() << "\n";
    return 1;
  }
}
