#include "lfsync/release_store.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace stdfs = std::filesystem;

namespace {

constexpr int kAssetsPerPage = 100;

std::string snippet(const std::string &body) {
  constexpr std::size_t kMax = 200;
  return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

[[nodiscard]] lfsync::StoreError status_error(const char *what, const lfsync::http::Response &r) {
  return lfsync::StoreError(std::string(what) + ": HTTP " + std::to_string(r.status) + " " +
                                snippet(r.body),
                            r.status);
}

json parse_body(const char *what, const lfsync::http::Response &r) {
  try {
    return json::parse(r.body);
  } catch (const json::exception &e) {
    throw lfsync::StoreError(std::string(what) + ": malformed response: " + e.what(), r.status);
  }
}

lfsync::Container container_from(const json &release) {
  std::string upload = release.at("upload_url").get<std::string>();
  // "https://uploads.github.com/.../assets{?name,label}"
  if (const auto brace = upload.find('{'); brace != std::string::npos)
    upload.erase(brace);
  return lfsync::Container{.tag = release.at("tag_name").get<std::string>(),
                           .id = std::to_string(release.at("id").get<long long>()),
                           .upload_url = std::move(upload),
                           .assets_url = release.at("assets_url").get<std::string>()};
}

lfsync::Asset asset_from(const json &a) {
  return lfsync::Asset{.name = a.at("name").get<std::string>(),
                       .size = a.value("size", std::uintmax_t{0}),
                       .id = std::to_string(a.at("id").get<long long>()),
                       .url = a.at("url").get<std::string>()};
}

} // namespace

namespace lfsync {

ReleaseStore::ReleaseStore(std::string repo, std::string token, std::string api_url,
                           StoreRetry retry)
    : repo_(std::move(repo)), token_(std::move(token)), retry_(std::move(retry)) {
  if (api_url.empty())
    api_url = consts::kGithubApi;
  while (!api_url.empty() && api_url.back() == '/')
    api_url.pop_back();
  repo_api_ = api_url + "/repos/" + repo_;
}

http::Headers ReleaseStore::api_headers() const {
  return {{"Authorization", "token " + token_},
          {"Accept", std::string(consts::kAcceptJson)},
          {"User-Agent", std::string(consts::kUserAgent)}};
}

// One API call under the retry policy; non-2xx becomes StoreError(status).
http::Response ReleaseStore::call(const char *what, std::string_view method,
                                  const std::string &url, std::string body) {
  return retry_.run(what, [&] {
    auto headers = api_headers();
    if (!body.empty())
      headers.emplace_back("Content-Type", "application/json");
    auto resp = client_.send(method, url, headers, body);
    if (!resp.ok())
      throw status_error(what, resp);
    return resp;
  });
}

std::optional<Container> ReleaseStore::find_container(const std::string &tag) {
  try {
    const auto resp = call("get release", "GET", repo_api_ + "/releases/tags/" +
                                                     http::percent_encode(tag));
    return container_from(parse_body("get release", resp));
  } catch (const StoreError &e) {
    if (e.not_found())
      return std::nullopt;
    throw;
  }
}

Container ReleaseStore::create_container(const std::string &tag) {
  const json req = {{"tag_name", tag},
                    {"name", "LFS Storage - " + tag},
                    {"body", "LFS storage for large files"},
                    {"draft", false},
                    {"prerelease", false}};
  const auto resp = call("create release", "POST", repo_api_ + "/releases", req.dump());
  return container_from(parse_body("create release", resp));
}

std::vector<Asset> ReleaseStore::list_assets(const Container &container) {
  std::vector<Asset> out;
  for (int page = 1;; ++page) {
    const std::string url = container.assets_url + "?per_page=" +
                            std::to_string(kAssetsPerPage) + "&page=" + std::to_string(page);
    const json arr = parse_body("list assets", call("list assets", "GET", url));
    if (!arr.is_array())
      throw StoreError("list assets: expected a JSON array", 0);
    for (const auto &a : arr)
      out.push_back(asset_from(a));
    if (arr.size() < static_cast<std::size_t>(kAssetsPerPage))
      break;
  }
  return out;
}

Asset ReleaseStore::upload_asset(const Container &container, const stdfs::path &file,
                                 const std::string &name, const TransferProgress &progress) {
  if (auto existing = find_asset(container, name)) {
    LOGI("Asset %s already exists, deleting old version", name.c_str());
    delete_asset(*existing);
  }

  const std::string url = container.upload_url + "?name=" + http::percent_encode(name);
  std::error_code ec;
  const auto size = stdfs::file_size(file, ec);
  LOGI("Uploading %s (%llu bytes)...", name.c_str(),
       static_cast<unsigned long long>(ec ? 0 : size));

  const auto resp = retry_.run("upload asset", [&] {
    auto headers = api_headers();
    headers.emplace_back("Content-Type", std::string(consts::kOctetStream));
    auto r = client_.send_file("POST", url, headers, file, progress);
    if (!r.ok())
      throw status_error("upload asset", r);
    return r;
  });
  Asset stored = asset_from(parse_body("upload asset", resp));
  LOGI("Uploaded asset: %s", stored.name.c_str());
  return stored;
}

void ReleaseStore::download_asset(const Asset &asset, const stdfs::path &dest,
                                  const TransferProgress &progress) {
  LOGI("Downloading %s (%llu bytes)...", asset.name.c_str(),
       static_cast<unsigned long long>(asset.size));
  retry_.run("download asset", [&] {
    auto headers = api_headers();
    for (auto &[k, v] : headers) {
      if (k == "Accept")
        v = std::string(consts::kOctetStream);
    }
    const auto r = client_.download(asset.url, headers, dest,
                                    [&](std::uintmax_t done, std::uintmax_t total) {
                                      if (progress)
                                        progress(done, total ? total : asset.size);
                                    });
    if (!r.ok()) {
      fs::remove_quietly(dest);
      throw status_error("download asset", r);
    }
  });
  LOGI("Downloaded: %s", asset.name.c_str());
}

void ReleaseStore::delete_asset(const Asset &asset) {
  call("delete asset", "DELETE", asset.url);
  LOGI("Deleted asset: %s", asset.name.c_str());
}

} // namespace lfsync
