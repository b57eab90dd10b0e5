#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

namespace lfsync::consts {

// Directory and file names inside the history clone
inline constexpr std::string_view kGitDir          = ".git";
inline constexpr std::string_view kLfsDir          = ".lfs";
inline constexpr std::string_view kManifestFile    = "manifest.json";
inline constexpr std::string_view kConfigOverrides = "sync-config.json";
inline constexpr std::string_view kSyncComplete    = ".sync-complete";
inline constexpr std::string_view kSyncProgress    = ".sync-progress.json";
inline constexpr std::string_view kSyncReady       = ".sync.ready";
inline constexpr std::string_view kLockFile        = "lfsync.lock"; // under kLfsDir
inline constexpr std::string_view kGitKeep         = ".gitkeep";
inline constexpr std::string_view kDefaultBranch   = "main";
inline constexpr std::string_view kRemoteName      = "origin";

// Pointer files
inline constexpr std::string_view kPointerSuffix  = ".pointer";
inline constexpr std::string_view kPointerType    = "lfs-pointer";
inline constexpr std::string_view kHashPrefix     = "sha256:";
inline constexpr int kPointerVersion              = 1;
inline constexpr std::uintmax_t kPointerSniffMax  = 2048; // content sniffing only below this

// Manifest
inline constexpr int kManifestVersion = 2;

// ——— Digest sizes ———
inline constexpr std::size_t kSha256RawLen = 32;
inline constexpr std::size_t kSha256HexLen = 64;
inline constexpr std::size_t kAssetHashPrefixLen = 12; // "<12 hex>-<name>"
inline constexpr std::size_t kHashChunk = 64 * 1024;

// ——— Defaults ———
inline constexpr std::uintmax_t kDefaultThreshold = 60ULL * 1024 * 1024;
inline constexpr std::string_view kDefaultReleaseTag = "large-files-v1";
inline constexpr int kDefaultMaxVersions = 3;
inline constexpr int kDefaultWorkers = 3;
inline constexpr std::chrono::seconds kDefaultInterval{180};
inline constexpr std::chrono::seconds kAlignBackoff{3};

// ——— Store retry ———
inline constexpr int kMaxAttempts = 3;

// ——— GitHub Releases ———
inline constexpr std::string_view kGithubApi   = "https://api.github.com";
inline constexpr std::string_view kUserAgent   = "lfsync/1.0";
inline constexpr std::string_view kAcceptJson  = "application/vnd.github.v3+json";
inline constexpr std::string_view kOctetStream = "application/octet-stream";

// ——— Commit messages ———
inline constexpr std::string_view kMsgInitial  = "chore(sync): initial commit";
inline constexpr std::string_view kMsgLink     = "chore(sync): initial link & empty dirs";
inline constexpr std::string_view kMsgPeriodic = "chore(sync): periodic commit";

} // namespace lfsync::consts
