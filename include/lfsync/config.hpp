#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lfsync {

struct Settings {
  std::filesystem::path base;     // root the sync targets are relative to
  std::filesystem::path hist_dir; // git working clone mirroring the targets
  std::string branch;
  std::string github_pat;
  std::string github_repo;        // "owner/repo"
  std::vector<std::string> targets;  // relative to base; a trailing '/' marks a directory
  std::vector<std::string> excludes; // relative to hist_dir
  std::chrono::seconds interval;

  // Offload
  bool lfs_enabled;
  std::uintmax_t lfs_threshold;  // files strictly larger than this are offloaded
  std::string lfs_release_tag;
  int lfs_max_versions;
  int lfs_max_workers;
  bool lfs_verify_hash;
  std::string lfs_store_url;     // empty: GitHub Releases; "file:///dir": local directory
  std::string api_url;

  std::string log_level;

  [[nodiscard]] auto manifest_path() const -> std::filesystem::path;
  [[nodiscard]] auto sync_complete_file() const -> std::filesystem::path;
  [[nodiscard]] auto sync_progress_file() const -> std::filesystem::path;
  [[nodiscard]] auto lock_file() const -> std::filesystem::path;
  // https://x-access-token:<pat>@github.com/<repo>.git
  [[nodiscard]] auto remote_url() const -> std::string;
};

// Environment lookup; std::nullopt when the variable is unset.
using EnvLookup = std::function<std::optional<std::string>(const char *name)>;

auto process_env() -> EnvLookup;

// Build Settings from the environment, then apply `targets`/`excludes` from
// <hist_dir>/sync-config.json when present. System marker files are always
// appended to the excludes. Malformed numbers raise ConfigError.
auto load_settings(const EnvLookup &env = process_env()) -> Settings;

// Fatal configuration problems (missing credentials, non-positive limits).
// Throws ConfigError.
void validate_settings(const Settings &settings);

// "home/user/x" under base "/" -> "/home/user/x"; absolute rel is returned unchanged.
auto to_abs_under_base(const std::filesystem::path &base, const std::string &rel)
    -> std::filesystem::path;

// "home/user/x" -> "<hist>/home/user/x"
auto to_under_hist(const std::filesystem::path &hist, const std::string &rel)
    -> std::filesystem::path;

} // namespace lfsync
