#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lfsync {

struct FileVersion {
  std::string hash;       // "sha256:<hex>"
  std::string asset_name;
  std::uintmax_t size;
  std::string timestamp;  // ISO-8601 UTC
  bool uploaded;
};

struct FileRecord {
  std::string current_hash;
  std::vector<FileVersion> versions; // append order
};

/**
 * Hash-indexed version ledger for offloaded files, keyed by the path relative
 * to the history directory and persisted whole-document as JSON:
 *
 *   {"version": 2, "last_updated": "...", "release_tag": "...",
 *    "files": {"<path>": {"current_hash": "...", "versions": [...]}}}
 *
 * One instance per history clone. All mutations are serialized by an
 * internal mutex; nothing protects the file against other processes.
 */
class Manifest {
public:
  using Clock = std::function<std::time_t()>;

  Manifest(std::filesystem::path manifest_path, std::string release_tag, Clock clock = {});

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] const std::string &release_tag() const { return release_tag_; }
  [[nodiscard]] auto last_updated() const -> std::string;

  // Read the document from disk. A missing file yields an empty manifest; a
  // corrupt one is logged and also yields an empty manifest.
  void load();

  // Stamp last_updated and atomically rewrite the document. Throws on I/O error.
  void save();

  [[nodiscard]] auto get_record(const std::string &path) const -> std::optional<FileRecord>;

  // Append a version unless one with the same hash exists; optionally make it
  // current. Returns true when a new version entry was appended.
  auto add_version(const std::string &path, const std::string &hash,
                   const std::string &asset_name, std::uintmax_t size, bool set_current = true)
      -> bool;

  // Version matching current_hash; if none matches (retention dropped it), the
  // most recently appended version. std::nullopt for unknown paths.
  [[nodiscard]] auto get_current_version(const std::string &path) const
      -> std::optional<FileVersion>;

  // All versions, newest first (timestamp, then append order).
  [[nodiscard]] auto get_all_versions(const std::string &path) const -> std::vector<FileVersion>;

  // Keep the `keep` newest versions; return evicted asset names. The caller
  // deletes those assets from the store and calls save().
  auto cleanup_old_versions(const std::string &path, int keep) -> std::vector<std::string>;

  // cleanup_old_versions over every path; only paths with evictions appear.
  auto cleanup_all_old_versions(int keep) -> std::map<std::string, std::vector<std::string>>;

  // Drop the record; returns every asset name it referenced.
  auto remove_file(const std::string &path) -> std::vector<std::string>;

  [[nodiscard]] auto list_files() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  auto now_string() const -> std::string;
  auto newest_first(const FileRecord &record) const -> std::vector<FileVersion>;

  std::filesystem::path path_;
  std::string release_tag_;
  Clock clock_;

  mutable std::mutex mu_;
  std::string last_updated_;
  std::map<std::string, FileRecord> files_;
};

} // namespace lfsync
