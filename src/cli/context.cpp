#include "cli/context.hpp"

#include "lfsync/dir_store.hpp"
#include "lfsync/error.hpp"
#include "lfsync/log.hpp"
#include "lfsync/release_store.hpp"

#include <string_view>

namespace lfsync::cli {

std::unique_ptr<BlobStore> make_store(const Settings &settings) {
  if (!settings.lfs_enabled)
    return nullptr;

  constexpr std::string_view kFileScheme = "file://";
  if (settings.lfs_store_url.starts_with(kFileScheme)) {
    const std::filesystem::path dir = settings.lfs_store_url.substr(kFileScheme.size());
    if (dir.empty() || !dir.is_absolute())
      throw ConfigError("LFS_STORE_URL must name an absolute directory: " +
                        settings.lfs_store_url);
    return std::make_unique<DirStore>(dir);
  }
  if (!settings.lfs_store_url.empty())
    throw ConfigError("unsupported LFS_STORE_URL: " + settings.lfs_store_url);

  if (settings.github_repo.empty() || settings.github_pat.empty()) {
    LOGW("Offload enabled but GITHUB_REPO/GITHUB_PAT missing; offload disabled");
    return nullptr;
  }
  return std::make_unique<ReleaseStore>(settings.github_repo, settings.github_pat,
                                        settings.api_url);
}

Context open_context(bool strict, bool exclusive) {
  Context ctx;
  ctx.settings = load_settings();
  log_set_level(parse_log_level(ctx.settings.log_level));
  if (strict)
    validate_settings(ctx.settings);

  const auto &st = ctx.settings;
  if (exclusive) {
    ctx.lock = FileLock::try_acquire(st.lock_file());
    if (!ctx.lock)
      throw Error("another lfsync process is working on " + st.hist_dir.string() +
                  " (lock " + st.lock_file().string() + ")");
  }
  ctx.vcs = std::make_unique<GitCli>(st.hist_dir);
  ctx.manifest = std::make_unique<Manifest>(st.manifest_path(), st.lfs_release_tag);
  ctx.manifest->load();

  ctx.store = make_store(st);
  if (ctx.store) {
    ctx.offload = std::make_unique<OffloadEngine>(
        *ctx.store, *ctx.manifest, ctx.vcs.get(), st.hist_dir,
        OffloadOptions{.release_tag = st.lfs_release_tag,
                       .threshold = st.lfs_threshold,
                       .excludes = st.excludes,
                       .workers = st.lfs_max_workers});
    ctx.restore = std::make_unique<RestoreEngine>(*ctx.store, *ctx.manifest, ctx.vcs.get(),
                                                  st.hist_dir, st.lfs_max_workers);
  }
  return ctx;
}

} // namespace lfsync::cli
