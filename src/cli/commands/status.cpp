#include "cli/context.hpp"

#include "lfsync/progress.hpp"

#include <iostream>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  try {
    auto ctx = lfsync::cli::open_context(/*strict=*/false, /*exclusive=*/false);
    const auto &st = ctx.settings;

    std::cout << "History:   " << st.hist_dir.string() << " (branch " << st.branch << ")\n";
    std::cout << "Remote:    " << (st.github_repo.empty() ? "(not configured)" : st.github_repo)
              << "\n";
    if (auto head = ctx.vcs->rev_parse("HEAD"))
      std::cout << "HEAD:      " << head->substr(0, 7) << "\n";
    else
      std::cout << "HEAD:      (no commits)\n";

    std::cout << "Offload:   ";
    if (!ctx.store)
      std::cout << "disabled\n";
    else
      std::cout << "> " << st.lfs_threshold << " bytes to '" << st.lfs_release_tag << "', keep "
                << st.lfs_max_versions << "\n";

    lfsync::ProgressReporter progress(st.sync_progress_file(), st.sync_complete_file());
    if (auto snap = progress.read()) {
      std::cout << "Progress:  " << snap->stage << " " << snap->percent << "%";
      if (snap->current && snap->total)
        std::cout << " (" << *snap->current << "/" << *snap->total << ")";
      std::cout << "\n";
    }
    std::cout << "Complete:  " << (progress.complete() ? "yes" : "no") << "\n\n";

    std::cout << "Offloaded files:\n";
    const auto files = ctx.manifest->list_files();
    if (files.empty())
      std::cout << "  (none)\n";
    for (const auto &path : files) {
      const auto cur = ctx.manifest->get_current_version(path);
      const auto versions = ctx.manifest->get_all_versions(path);
      std::cout << "  " << path;
      if (cur)
        std::cout << "  " << cur->asset_name << "  " << cur->size << " bytes";
      std::cout << "  [" << versions.size() << " version(s)]\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
