#pragma once
#include "lfsync/blob_store.hpp"
#include "lfsync/error.hpp"
#include "lfsync/http.hpp"
#include "lfsync/retry.hpp"

#include <string>

namespace lfsync {

// Retry network failures and 5xx responses only.
struct TransientStoreError {
  auto operator()(const StoreError &e) const noexcept -> bool { return e.transient(); }
};

using StoreRetry = RetryPolicy<StoreError, TransientStoreError>;

/**
 * BlobStore backed by the GitHub Releases REST API. A container is a release
 * looked up by tag; assets are release assets.
 *
 * Every call goes through the retry policy, upload and download included.
 */
class ReleaseStore : public BlobStore {
public:
  // `repo` is "owner/name"; `api_url` defaults to https://api.github.com.
  ReleaseStore(std::string repo, std::string token, std::string api_url = {},
               StoreRetry retry = StoreRetry{});

  auto find_container(const std::string &tag) -> std::optional<Container> override;
  auto create_container(const std::string &tag) -> Container override;
  auto list_assets(const Container &container) -> std::vector<Asset> override;
  auto upload_asset(const Container &container, const std::filesystem::path &file,
                    const std::string &name, const TransferProgress &progress = {})
      -> Asset override;
  void download_asset(const Asset &asset, const std::filesystem::path &dest,
                      const TransferProgress &progress = {}) override;
  void delete_asset(const Asset &asset) override;

private:
  auto api_headers() const -> http::Headers;
  auto call(const char *what, std::string_view method, const std::string &url,
            std::string body = {}) -> http::Response;

  std::string repo_;
  std::string token_;
  std::string repo_api_; // <api>/repos/<owner>/<name>
  StoreRetry retry_;
  http::Client client_;
};

} // namespace lfsync
