#include "cli/context.hpp"

#include "lfsync/sync.hpp"

#include <iostream>
#include <optional>

int cmd_sync(int /*argc*/, char ** /*argv*/) {
  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/true, /*exclusive=*/true);
    const auto &st = ctx.settings;
    if (!ctx.vcs->rev_parse("HEAD")) {
      std::cerr << "sync: " << st.hist_dir.string()
                << " has no history yet (run `lfsync daemon` first)\n";
      return 1;
    }

    std::optional<lfsync::OffloadServices> lfs;
    if (ctx.offload && ctx.restore)
      lfs.emplace(lfsync::OffloadServices{.offload = *ctx.offload, .restore = *ctx.restore});

    lfsync::SyncCoordinator coordinator(*ctx.vcs,
                                        lfsync::SyncOptions{.branch = st.branch,
                                                            .remote_url = st.remote_url(),
                                                            .excludes = st.excludes,
                                                            .interval = st.interval,
                                                            .max_versions = st.lfs_max_versions,
                                                            .verify_hash = st.lfs_verify_hash},
                                        lfs);
    const bool committed = coordinator.sync_now();
    std::cout << (committed ? "Committed and pushed changes\n" : "Nothing to commit\n");
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
