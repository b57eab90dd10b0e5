#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lfsync {

// A tagged grouping of assets (a GitHub release, or a directory).
struct Container {
  std::string tag;
  std::string id;
  std::string upload_url; // implementation-specific locator for uploads
  std::string assets_url; // implementation-specific locator for listing
};

struct Asset {
  std::string name;
  std::uintmax_t size;
  std::string id;
  std::string url; // implementation-specific locator for download/delete
};

// (bytes done, bytes total); total is 0 when unknown.
using TransferProgress = std::function<void(std::uintmax_t, std::uintmax_t)>;

/**
 * External store of containers holding uniquely named binary assets.
 *
 * Calls carry no per-call state in the object, so one instance may be used
 * from several workers at once. Lookups report absence as std::nullopt;
 * failures raise StoreError.
 */
class BlobStore {
public:
  virtual ~BlobStore() = default;

  virtual auto find_container(const std::string &tag) -> std::optional<Container> = 0;
  virtual auto create_container(const std::string &tag) -> Container = 0;

  // Idempotent; tolerates another worker creating the container concurrently.
  auto get_or_create_container(const std::string &tag) -> Container;

  virtual auto list_assets(const Container &container) -> std::vector<Asset> = 0;
  virtual auto find_asset(const Container &container, const std::string &name)
      -> std::optional<Asset>;

  // Deletes any asset already stored under `name`, then streams `file` up.
  // The returned Asset carries the name the store actually used, which is
  // authoritative and may differ from `name`.
  virtual auto upload_asset(const Container &container, const std::filesystem::path &file,
                            const std::string &name, const TransferProgress &progress = {})
      -> Asset = 0;

  // Streams the payload to `dest` (overwritten) with bounded memory.
  virtual void download_asset(const Asset &asset, const std::filesystem::path &dest,
                              const TransferProgress &progress = {}) = 0;

  virtual void delete_asset(const Asset &asset) = 0;
};

} // namespace lfsync
