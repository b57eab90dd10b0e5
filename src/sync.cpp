#include "lfsync/sync.hpp"

#include "lfsync/log.hpp"

namespace lfsync {

std::string_view to_string(SyncState state) {
  switch (state) {
  case SyncState::Uninitialized:
    return "uninitialized";
  case SyncState::Aligning:
    return "aligning";
  case SyncState::Linking:
    return "linking";
  case SyncState::Restoring:
    return "restoring";
  case SyncState::Steady:
    return "steady";
  case SyncState::Stopped:
    return "stopped";
  }
  return "unknown";
}

void StopSignal::request_stop() {
  {
    const std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool StopSignal::stop_requested() const {
  const std::lock_guard<std::mutex> lk(mu_);
  return stopped_;
}

bool StopSignal::wait_for(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, d, [this] { return stopped_; });
}

SyncCoordinator::SyncCoordinator(VersionControl &vcs, SyncOptions options,
                                 std::optional<OffloadServices> lfs, ProgressReporter *progress)
    : vcs_(vcs), opts_(std::move(options)), lfs_(lfs), progress_(progress),
      wait_([this](std::chrono::seconds d) { return stop_.wait_for(d); }) {}

void SyncCoordinator::set_state(SyncState s) {
  state_.store(s);
  LOGD("state -> %.*s", static_cast<int>(to_string(s).size()), to_string(s).data());
}

void SyncCoordinator::report(std::string stage, int percent, std::optional<std::size_t> current,
                             std::optional<std::size_t> total) {
  if (progress_ != nullptr)
    progress_->write(ProgressSnapshot{
        .stage = std::move(stage), .percent = percent, .current = current, .total = total});
}

void SyncCoordinator::stop() {
  LOGI("Stop requested");
  stop_.request_stop();
}

bool SyncCoordinator::head_matches_remote() {
  try {
    const auto local = vcs_.rev_parse("HEAD");
    const auto remote = vcs_.rev_parse(std::string(consts::kRemoteName) + "/" + opts_.branch);
    return local && remote && !local->empty() && *local == *remote;
  } catch (const std::exception &e) {
    LOGW("HEAD comparison failed: %s", e.what());
    return false;
  }
}

bool SyncCoordinator::align() {
  set_state(SyncState::Aligning);
  {
    const std::lock_guard<std::mutex> lk(mu_);
    vcs_.ensure_repo(opts_.branch);
    vcs_.add_exclusions(opts_.excludes);
    vcs_.set_remote(opts_.remote_url);
  }

  while (!stop_.stop_requested()) {
    ++align_attempts_;
    try {
      const std::lock_guard<std::mutex> lk(mu_);
      if (vcs_.remote_is_empty(opts_.branch)) {
        LOGI("Remote is empty: creating the initial commit and pushing");
        vcs_.initial_commit_if_needed();
        vcs_.push(opts_.branch);
      } else {
        vcs_.fetch_and_reset(opts_.branch);
      }
      if (head_matches_remote()) {
        LOGI("Initial pull complete, HEAD aligned with remote");
        return true;
      }
      LOGI("HEAD not aligned with remote, retrying");
    } catch (const std::exception &e) {
      LOGE("Initialization/pull failed: %s", e.what());
    }
    if (wait_(opts_.align_backoff))
      break;
  }
  return false;
}

void SyncCoordinator::link() {
  set_state(SyncState::Linking);
  const std::lock_guard<std::mutex> lk(mu_);
  if (linker_) {
    try {
      linker_();
    } catch (const std::exception &e) {
      LOGE("Linking failed: %s", e.what());
    }
  }
  try {
    if (vcs_.commit_all_if_dirty(std::string(consts::kMsgLink))) {
      try {
        vcs_.push(opts_.branch);
      } catch (const std::exception &e) {
        LOGE("Initial push failed (ignored): %s", e.what());
      }
    }
  } catch (const std::exception &e) {
    LOGE("Initial link commit failed: %s", e.what());
  }
}

void SyncCoordinator::restore_all() {
  set_state(SyncState::Restoring);
  if (!lfs_) {
    LOGI("Offload not available, skipping restore");
    return;
  }
  const std::lock_guard<std::mutex> lk(mu_);
  report("lfs_download", 50, 0, 0);
  try {
    lfs_->restore.restore_all(opts_.verify_hash, [this](std::size_t done, std::size_t total) {
      const int pct = total > 0 ? 50 + static_cast<int>(done * 45 / total) : 50;
      report("lfs_download", pct, done, total);
    });
  } catch (const std::exception &e) {
    LOGE("Restore failed: %s", e.what());
  }
  report("lfs_download", 95);
}

bool SyncCoordinator::sync_now() {
  const std::lock_guard<std::mutex> lk(mu_);
  ++cycles_;

  try {
    vcs_.pull_rebase(opts_.branch);
  } catch (const std::exception &e) {
    LOGE("Pull failed: %s", e.what());
  }

  // A rebase can delete working files shadowed by a pointer; bring them back
  // before anything looks for large files.
  if (lfs_) {
    try {
      lfs_->restore.restore_missing(opts_.verify_hash);
    } catch (const std::exception &e) {
      LOGE("Restore after pull failed: %s", e.what());
    }
    try {
      lfs_->offload.offload_all();
    } catch (const std::exception &e) {
      LOGE("Offload failed: %s", e.what());
    }
    try {
      const auto deleted = lfs_->offload.cleanup(opts_.max_versions);
      if (deleted > 0)
        LOGI("Deleted %zu old assets", deleted);
    } catch (const std::exception &e) {
      LOGE("Retention cleanup failed: %s", e.what());
    }
  }

  bool committed = false;
  try {
    committed = vcs_.commit_all_if_dirty(std::string(consts::kMsgPeriodic));
  } catch (const std::exception &e) {
    LOGE("Commit failed: %s", e.what());
  }
  try {
    vcs_.push(opts_.branch);
    if (committed)
      LOGI("Committed and pushed changes");
  } catch (const std::exception &e) {
    LOGE("Push failed: %s", e.what());
  }
  return committed;
}

int SyncCoordinator::run() {
  LOGI("Starting sync daemon");
  report("starting", 0);

  report("git", 10);
  if (!align()) {
    set_state(SyncState::Stopped);
    return 0;
  }
  report("git", 25);

  report("linking", 30);
  link();
  report("linking", 50);

  restore_all();
  if (progress_ != nullptr)
    progress_->mark_complete();

  set_state(SyncState::Steady);
  LOGI("Entering periodic sync loop");
  while (!stop_.stop_requested()) {
    sync_now();
    if (wait_(opts_.interval))
      break;
  }
  set_state(SyncState::Stopped);
  return 0;
}

} // namespace lfsync
