#include "lfsync/config.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"
#include "lfsync/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <string_view>

using json = nlohmann::json;

namespace {

std::string env_or(const lfsync::EnvLookup &env, const char *name, std::string_view fallback) {
  if (auto v = env(name))
    return *v;
  return std::string(fallback);
}

long long env_int(const lfsync::EnvLookup &env, const char *name, long long fallback) {
  const auto v = env(name);
  if (!v || lfsync::strutil::trim(*v).empty())
    return fallback;
  try {
    std::size_t used = 0;
    const std::string s = lfsync::strutil::trim(*v);
    const long long n = std::stoll(s, &used);
    if (used != s.size())
      throw std::invalid_argument(s);
    return n;
  } catch (const std::exception &) {
    throw lfsync::ConfigError(std::string(name) + " is not an integer: " + *v);
  }
}

bool env_bool(const lfsync::EnvLookup &env, const char *name, bool fallback) {
  const auto v = env(name);
  if (!v)
    return fallback;
  std::string s = lfsync::strutil::trim(*v);
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s == "true" || s == "1" || s == "yes";
}

// sync-config.json; any problem reading it means "no overrides".
json load_overrides(const std::filesystem::path &hist_dir) {
  const auto p = hist_dir / lfsync::consts::kConfigOverrides;
  if (!lfsync::fs::exists(p))
    return json::object();
  try {
    json obj = json::parse(lfsync::fs::read_text(p));
    if (obj.is_object())
      return obj;
    LOGW("%s is not a JSON object, ignoring", p.c_str());
  } catch (const std::exception &e) {
    LOGW("ignoring unreadable %s: %s", p.c_str(), e.what());
  }
  return json::object();
}

std::vector<std::string> string_list(const json &arr) {
  std::vector<std::string> out;
  for (const auto &x : arr) {
    if (!x.is_string())
      continue;
    std::string s = lfsync::strutil::strip_slashes(lfsync::strutil::trim(x.get<std::string>()));
    if (!s.empty())
      out.push_back(std::move(s));
  }
  return out;
}

// Targets keep one trailing '/' so "dir/" still names a directory.
std::vector<std::string> target_list(const json &arr) {
  std::vector<std::string> out;
  for (const auto &x : arr) {
    if (!x.is_string())
      continue;
    const std::string raw = lfsync::strutil::trim(x.get<std::string>());
    std::string s = lfsync::strutil::strip_slashes(raw);
    if (s.empty())
      continue;
    if (raw.back() == '/')
      s.push_back('/');
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace

namespace lfsync {

std::filesystem::path Settings::manifest_path() const {
  return hist_dir / consts::kLfsDir / consts::kManifestFile;
}

std::filesystem::path Settings::sync_complete_file() const { return hist_dir / consts::kSyncComplete; }

std::filesystem::path Settings::sync_progress_file() const { return hist_dir / consts::kSyncProgress; }

std::filesystem::path Settings::lock_file() const {
  return hist_dir / consts::kLfsDir / consts::kLockFile;
}

std::string Settings::remote_url() const {
  return "https://x-access-token:" + github_pat + "@github.com/" + github_repo + ".git";
}

EnvLookup process_env() {
  return [](const char *name) -> std::optional<std::string> {
    if (const char *v = std::getenv(name))
      return std::string(v);
    return std::nullopt;
  };
}

Settings load_settings(const EnvLookup &env) {
  Settings st{};
  std::string base = env_or(env, "BASE", "/");
  while (base.size() > 1 && base.back() == '/')
    base.pop_back();
  st.base = base.empty() ? std::filesystem::path("/") : std::filesystem::path(base);
  st.hist_dir = std::filesystem::absolute(env_or(env, "HIST_DIR", "/home/user/.sync-backup"))
                    .lexically_normal();
  st.branch = env_or(env, "GIT_BRANCH", consts::kDefaultBranch);
  st.github_pat = env_or(env, "GITHUB_PAT", "");
  st.github_repo = env_or(env, "GITHUB_REPO", "");
  st.targets = strutil::split_ws(env_or(env, "SYNC_TARGETS", ""));
  st.excludes = strutil::split_ws(env_or(env, "EXCLUDE_PATHS", ""));
  st.interval = std::chrono::seconds(
      env_int(env, "SYNC_INTERVAL", consts::kDefaultInterval.count()));

  st.lfs_enabled = env_bool(env, "LFS_ENABLED", true);
  const long long threshold = env_int(env, "LFS_THRESHOLD",
                                      static_cast<long long>(consts::kDefaultThreshold));
  if (threshold < 0)
    throw ConfigError("LFS_THRESHOLD must not be negative");
  st.lfs_threshold = static_cast<std::uintmax_t>(threshold);
  st.lfs_release_tag = env_or(env, "LFS_RELEASE_TAG", consts::kDefaultReleaseTag);
  st.lfs_max_versions =
      static_cast<int>(env_int(env, "LFS_MAX_VERSIONS", consts::kDefaultMaxVersions));
  st.lfs_max_workers = static_cast<int>(env_int(env, "LFS_MAX_WORKERS", consts::kDefaultWorkers));
  st.lfs_verify_hash = env_bool(env, "LFS_VERIFY_HASH", true);
  st.lfs_store_url = env_or(env, "LFS_STORE_URL", "");
  st.api_url = env_or(env, "LFSYNC_API_URL", consts::kGithubApi);
  st.log_level = env_or(env, "LFSYNC_LOG_LEVEL", "info");

  const json overrides = load_overrides(st.hist_dir);
  if (auto it = overrides.find("targets"); it != overrides.end() && it->is_array()) {
    auto targets = target_list(*it);
    if (!targets.empty())
      st.targets = std::move(targets);
  }
  if (auto it = overrides.find("excludes"); it != overrides.end() && it->is_array()) {
    auto excludes = string_list(*it);
    if (!excludes.empty())
      st.excludes = std::move(excludes);
  }

  const std::string lock_rel = std::string(consts::kLfsDir) + "/" + std::string(consts::kLockFile);
  for (std::string_view sys :
       {consts::kSyncComplete, consts::kSyncProgress, consts::kSyncReady, std::string_view(lock_rel)}) {
    if (std::ranges::find(st.excludes, sys) == st.excludes.end())
      st.excludes.emplace_back(sys);
  }
  return st;
}

void validate_settings(const Settings &st) {
  if (st.github_repo.empty() || st.github_pat.empty())
    throw ConfigError("GITHUB_REPO/GITHUB_PAT not configured");
  if (st.github_repo.find('/') == std::string::npos)
    throw ConfigError("GITHUB_REPO must look like owner/repo: " + st.github_repo);
  if (st.branch.empty())
    throw ConfigError("GIT_BRANCH is empty");
  if (st.interval.count() <= 0)
    throw ConfigError("SYNC_INTERVAL must be positive");
  if (st.lfs_enabled) {
    if (st.lfs_release_tag.empty())
      throw ConfigError("LFS_RELEASE_TAG is empty");
    if (st.lfs_max_versions <= 0)
      throw ConfigError("LFS_MAX_VERSIONS must be positive");
    if (st.lfs_max_workers <= 0)
      throw ConfigError("LFS_MAX_WORKERS must be positive");
  }
}

std::filesystem::path to_abs_under_base(const std::filesystem::path &base, const std::string &rel) {
  if (!rel.empty() && rel.front() == '/')
    return std::filesystem::path(rel);
  return (base / rel).lexically_normal();
}

std::filesystem::path to_under_hist(const std::filesystem::path &hist, const std::string &rel) {
  return (hist / strutil::strip_slashes(rel)).lexically_normal();
}

} // namespace lfsync
