#include "lfsync/dir_store.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace stdfs = std::filesystem;

namespace {

bool is_staging_file(const stdfs::path &p) {
  const auto name = p.filename().string();
  return name.find(".lfsync-") != std::string::npos && name.ends_with(".tmp");
}

// Chunked copy into a sibling temp file, then rename over dst.
void copy_with_progress(const stdfs::path &src, const stdfs::path &dst,
                        const lfsync::TransferProgress &progress) {
  std::ifstream in(src, std::ios::binary);
  if (!in)
    throw lfsync::StoreError("open for read failed: " + src.string(), 404);

  std::error_code ec;
  const auto total = stdfs::file_size(src, ec);
  lfsync::fs::ensure_parent_dir(dst);
  const auto tmp = lfsync::fs::temp_path_beside(dst);
  try {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw lfsync::StoreError("open for write failed: " + tmp.string(), 0);

    std::vector<char> buf(lfsync::consts::kHashChunk);
    std::uintmax_t done = 0;
    while (in) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto n = in.gcount();
      if (n <= 0)
        break;
      out.write(buf.data(), n);
      if (!out)
        throw lfsync::StoreError("write failed: " + tmp.string(), 0);
      done += static_cast<std::uintmax_t>(n);
      if (progress)
        progress(done, ec ? 0 : total);
    }
    if (in.bad())
      throw lfsync::StoreError("read failed: " + src.string(), 0);
    out.close();
    if (!out)
      throw lfsync::StoreError("close failed: " + tmp.string(), 0);
    lfsync::fs::replace_file(tmp, dst);
  } catch (...) {
    lfsync::fs::remove_quietly(tmp);
    throw;
  }
}

// Asset names are single path components inside the container directory.
stdfs::path asset_path(const std::string &dir, const std::string &name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
      name.find('\\') != std::string::npos)
    throw lfsync::StoreError("invalid asset name: " + name, 400);
  return stdfs::path(dir) / name;
}

} // namespace

namespace lfsync {

DirStore::DirStore(stdfs::path root) : root_(std::move(root)) {}

stdfs::path DirStore::container_dir(const std::string &tag) const { return root_ / tag; }

Asset DirStore::asset_at(const stdfs::path &p) {
  std::error_code ec;
  const auto size = stdfs::file_size(p, ec);
  return Asset{.name = p.filename().string(),
               .size = ec ? 0 : size,
               .id = p.filename().string(),
               .url = p.string()};
}

std::optional<Container> DirStore::find_container(const std::string &tag) {
  const auto dir = container_dir(tag);
  std::error_code ec;
  if (!stdfs::is_directory(dir, ec))
    return std::nullopt;
  return Container{.tag = tag, .id = tag, .upload_url = dir.string(), .assets_url = dir.string()};
}

Container DirStore::create_container(const std::string &tag) {
  const auto dir = container_dir(tag);
  std::error_code ec;
  stdfs::create_directories(dir, ec);
  if (ec)
    throw StoreError("create container " + tag + " failed: " + ec.message(), 0);
  return Container{.tag = tag, .id = tag, .upload_url = dir.string(), .assets_url = dir.string()};
}

std::vector<Asset> DirStore::list_assets(const Container &container) {
  std::vector<Asset> out;
  std::error_code ec;
  for (stdfs::directory_iterator it(container.assets_url, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file() || is_staging_file(it->path()))
      continue;
    out.push_back(asset_at(it->path()));
  }
  if (ec)
    throw StoreError("list " + container.tag + " failed: " + ec.message(),
                     ec == std::errc::no_such_file_or_directory ? 404 : 0);
  std::ranges::sort(out, [](const Asset &a, const Asset &b) { return a.name < b.name; });
  return out;
}

std::optional<Asset> DirStore::find_asset(const Container &container, const std::string &name) {
  const stdfs::path p = asset_path(container.assets_url, name);
  if (!fs::is_regular_file(p))
    return std::nullopt;
  return asset_at(p);
}

Asset DirStore::upload_asset(const Container &container, const stdfs::path &file,
                             const std::string &name, const TransferProgress &progress) {
  const stdfs::path dst = asset_path(container.upload_url, name);
  if (auto existing = find_asset(container, name)) {
    LOGI("Asset %s already exists, deleting old version", name.c_str());
    delete_asset(*existing);
  }
  copy_with_progress(file, dst, progress);
  LOGI("Uploaded asset: %s", name.c_str());
  return asset_at(dst);
}

void DirStore::download_asset(const Asset &asset, const stdfs::path &dest,
                              const TransferProgress &progress) {
  copy_with_progress(asset.url, dest, progress);
}

void DirStore::delete_asset(const Asset &asset) {
  std::error_code ec;
  if (!stdfs::remove(asset.url, ec) && ec)
    throw StoreError("delete " + asset.name + " failed: " + ec.message(), 0);
  LOGI("Deleted asset: %s", asset.name.c_str());
}

} // namespace lfsync
