#pragma once
#include "lfsync/blob_store.hpp"

#include <filesystem>

namespace lfsync {

// BlobStore over a local directory: <root>/<tag>/<asset name>.
// Used for "file://" store URLs and as the store in tests.
class DirStore : public BlobStore {
public:
  explicit DirStore(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  auto find_container(const std::string &tag) -> std::optional<Container> override;
  auto create_container(const std::string &tag) -> Container override;
  auto list_assets(const Container &container) -> std::vector<Asset> override;
  auto find_asset(const Container &container, const std::string &name)
      -> std::optional<Asset> override;
  auto upload_asset(const Container &container, const std::filesystem::path &file,
                    const std::string &name, const TransferProgress &progress = {})
      -> Asset override;
  void download_asset(const Asset &asset, const std::filesystem::path &dest,
                      const TransferProgress &progress = {}) override;
  void delete_asset(const Asset &asset) override;

private:
  auto container_dir(const std::string &tag) const -> std::filesystem::path;
  static auto asset_at(const std::filesystem::path &p) -> Asset;

  std::filesystem::path root_;
};

} // namespace lfsync
