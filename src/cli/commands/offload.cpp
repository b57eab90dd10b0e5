#include "cli/context.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <vector>

int cmd_offload(int argc, char **argv) {
  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/false, /*exclusive=*/true);
    if (!ctx.offload) {
      std::cerr << "offload: no blob store configured (LFS_ENABLED, GITHUB_PAT or LFS_STORE_URL)\n";
      return 1;
    }

    std::map<std::string, bool> results;
    if (argc < 2) {
      results = ctx.offload->offload_all();
    } else {
      std::vector<std::filesystem::path> files;
      for (int i = 1; i < argc; ++i)
        files.push_back(std::filesystem::absolute(argv[i]).lexically_normal());
      results = ctx.offload->offload_paths(files);
    }

    int failed = 0;
    for (const auto &[path, ok] : results) {
      std::cout << (ok ? "offloaded  " : "FAILED     ") << path << "\n";
      failed += ok ? 0 : 1;
    }
    if (results.empty())
      std::cout << "No files above " << ctx.settings.lfs_threshold << " bytes\n";
    return failed == 0 ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "offload: " << e.what() << "\n";
    return 1;
  }
}
