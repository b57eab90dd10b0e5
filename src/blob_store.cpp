#include "lfsync/blob_store.hpp"

#include "lfsync/error.hpp"
#include "lfsync/log.hpp"

namespace lfsync {

Container BlobStore::get_or_create_container(const std::string &tag) {
  if (auto found = find_container(tag))
    return *found;
  try {
    auto created = create_container(tag);
    LOGI("Created container: %s", tag.c_str());
    return created;
  } catch (const StoreError &e) {
    // Lost a creation race with another worker: the tag exists now.
    if (e.status() != 422 && e.status() != 409)
      throw;
    if (auto found = find_container(tag))
      return *found;
    throw;
  }
}

std::optional<Asset> BlobStore::find_asset(const Container &container, const std::string &name) {
  for (auto &asset : list_assets(container)) {
    if (asset.name == name)
      return std::move(asset);
  }
  return std::nullopt;
}

} // namespace lfsync
