#pragma once
#include "lfsync/consts.hpp"
#include "lfsync/offload.hpp"
#include "lfsync/progress.hpp"
#include "lfsync/restore.hpp"
#include "lfsync/vcs.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfsync {

enum class SyncState {
  Uninitialized,
  Aligning,
  Linking,
  Restoring,
  Steady,
  Stopped,
};

auto to_string(SyncState state) -> std::string_view;

// Process-wide stop request that interrupts timed waits.
class StopSignal {
public:
  void request_stop();
  [[nodiscard]] auto stop_requested() const -> bool;
  // Sleep up to `d`; returns true as soon as a stop is requested.
  auto wait_for(std::chrono::milliseconds d) -> bool;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stopped_{false};
};

struct SyncOptions {
  std::string branch{consts::kDefaultBranch};
  std::string remote_url;
  std::vector<std::string> excludes; // registered as history exclusions up front
  std::chrono::seconds interval{consts::kDefaultInterval};
  std::chrono::seconds align_backoff{consts::kAlignBackoff};
  int max_versions{consts::kDefaultMaxVersions};
  bool verify_hash{true};
};

// The store-backed half of a cycle; absent when offloading is unavailable.
struct OffloadServices {
  OffloadEngine &offload;
  RestoreEngine &restore;
};

/**
 * Drives the history directory through
 *   Uninitialized -> Aligning -> Linking -> Restoring -> Steady
 * and then runs the periodic cycle
 *   pull --rebase, restore missing files, offload, retention, commit, push
 * until stopped. A single mutex serializes cycles, including sync_now().
 *
 * Failures inside a cycle are logged and retried next period.
 */
class SyncCoordinator {
public:
  using Linker = std::function<void()>;
  // Waits up to the given duration; returns true when the wait was cut short
  // by a stop request.
  using Wait = std::function<bool(std::chrono::seconds)>;

  SyncCoordinator(VersionControl &vcs, SyncOptions options,
                  std::optional<OffloadServices> lfs = std::nullopt,
                  ProgressReporter *progress = nullptr);

  void set_linker(Linker linker) { linker_ = std::move(linker); }
  void set_wait(Wait wait) { wait_ = std::move(wait); }

  // Whole lifecycle; returns once stop() is called.
  auto run() -> int;

  // Aligning. Returns true once local HEAD equals the remote-tracking HEAD,
  // false when stopped first. Setup failures (init, remote) throw VcsError.
  auto align() -> bool;
  // Linking: external migration hook, then a settlement commit and push.
  void link();
  // Restoring: one full restore pass.
  void restore_all();
  // One periodic cycle on the caller's thread. Returns true if it committed.
  auto sync_now() -> bool;

  void stop();
  [[nodiscard]] auto stop_requested() const -> bool { return stop_.stop_requested(); }

  [[nodiscard]] auto state() const -> SyncState { return state_.load(); }
  [[nodiscard]] auto align_attempts() const -> int { return align_attempts_.load(); }
  [[nodiscard]] auto cycles() const -> int { return cycles_.load(); }

private:
  auto head_matches_remote() -> bool;
  void set_state(SyncState s);
  void report(std::string stage, int percent, std::optional<std::size_t> current = std::nullopt,
              std::optional<std::size_t> total = std::nullopt);

  VersionControl &vcs_;
  SyncOptions opts_;
  std::optional<OffloadServices> lfs_;
  ProgressReporter *progress_;
  Linker linker_;
  Wait wait_;

  std::mutex mu_; // repository and manifest mutations
  StopSignal stop_;
  std::atomic<SyncState> state_{SyncState::Uninitialized};
  std::atomic<int> align_attempts_{0};
  std::atomic<int> cycles_{0};
};

} // namespace lfsync
