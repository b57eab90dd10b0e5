#include "cli/context.hpp"

#include <iostream>

int cmd_cleanup(int /*argc*/, char ** /*argv*/) {
  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/false, /*exclusive=*/true);
    if (!ctx.offload) {
      std::cerr << "cleanup: no blob store configured\n";
      return 1;
    }
    const auto deleted = ctx.offload->cleanup(ctx.settings.lfs_max_versions);
    std::cout << "Deleted " << deleted << " old asset(s), keeping "
              << ctx.settings.lfs_max_versions << " version(s) per file\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "cleanup: " << e.what() << "\n";
    return 1;
  }
}
