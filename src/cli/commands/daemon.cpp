#include "cli/context.hpp"

#include "lfsync/linker.hpp"
#include "lfsync/log.hpp"
#include "lfsync/progress.hpp"
#include "lfsync/sync.hpp"

#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <optional>
#include <pthread.h>
#include <thread>

int cmd_daemon(int /*argc*/, char ** /*argv*/) {
  // Block the stop signals before any thread exists so only sigtimedwait sees them.
  sigset_t stop_set;
  sigemptyset(&stop_set);
  sigaddset(&stop_set, SIGINT);
  sigaddset(&stop_set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_set, nullptr);

  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/true, /*exclusive=*/true);
    const auto &st = ctx.settings;

    std::optional<lfsync::OffloadServices> lfs;
    if (ctx.offload && ctx.restore)
      lfs.emplace(lfsync::OffloadServices{.offload = *ctx.offload, .restore = *ctx.restore});
    else
      LOGI("Offload not enabled or not available");

    lfsync::ProgressReporter progress(st.sync_progress_file(), st.sync_complete_file());
    lfsync::SyncCoordinator coordinator(*ctx.vcs,
                                        lfsync::SyncOptions{.branch = st.branch,
                                                            .remote_url = st.remote_url(),
                                                            .excludes = st.excludes,
                                                            .interval = st.interval,
                                                            .max_versions = st.lfs_max_versions,
                                                            .verify_hash = st.lfs_verify_hash},
                                        lfs, &progress);

    coordinator.set_linker([&st] {
      lfsync::linker::precreate_dirlike(st.hist_dir, st.targets);
      (void)lfsync::linker::migrate_and_link(st.base, st.hist_dir, st.targets);
      (void)lfsync::linker::track_empty_dirs(st.hist_dir, st.targets, st.excludes);
    });

    std::atomic<bool> finished{false};
    std::thread signals([&] {
      const timespec tick{.tv_sec = 1, .tv_nsec = 0};
      while (!finished.load()) {
        const int sig = sigtimedwait(&stop_set, nullptr, &tick);
        if (sig == SIGINT || sig == SIGTERM) {
          LOGI("Received signal %d", sig);
          coordinator.stop();
          return;
        }
      }
    });

    LOGI("Syncing %s (branch %s, every %llds)", st.hist_dir.c_str(), st.branch.c_str(),
         static_cast<long long>(st.interval.count()));
    int rc = 0;
    try {
      rc = coordinator.run();
    } catch (const std::exception &e) {
      std::cerr << "daemon: " << e.what() << "\n";
      rc = 1;
    }
    finished = true;
    signals.join();
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "daemon: " << e.what() << "\n";
    return 1;
  }
}
