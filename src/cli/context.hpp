#pragma once
#include "lfsync/blob_store.hpp"
#include "lfsync/config.hpp"
#include "lfsync/git_cli.hpp"
#include "lfsync/manifest.hpp"
#include "lfsync/offload.hpp"
#include "lfsync/process.hpp"
#include "lfsync/restore.hpp"

#include <memory>
#include <optional>

namespace lfsync::cli {

// Everything a command needs, wired from the environment. Engines are only
// present when a store is available.
struct Context {
  Settings settings;
  std::unique_ptr<BlobStore> store;
  std::unique_ptr<Manifest> manifest;
  std::unique_ptr<GitCli> vcs;
  std::unique_ptr<OffloadEngine> offload;
  std::unique_ptr<RestoreEngine> restore;
  std::optional<FileLock> lock; // held by commands that modify the clone
};

// Store selected by the settings: a DirStore for "file://" URLs, GitHub
// Releases otherwise. Null when offloading is disabled or has no credentials.
auto make_store(const Settings &settings) -> std::unique_ptr<BlobStore>;

// Load settings (and validate them when `strict`), apply the log level, load
// the manifest and build the engines. Throws ConfigError.
//
// `exclusive` takes <hist>/.lfs/lfsync.lock first and throws Error when
// another lfsync process (a running daemon, say) holds it.
auto open_context(bool strict, bool exclusive) -> Context;

} // namespace lfsync::cli
