#include "lfsync/manifest.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"
#include "lfsync/time.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <numeric>

using json = nlohmann::json;

namespace lfsync {

// nlohmann ADL hooks
void to_json(json &j, const FileVersion &v) {
  j = json{{"hash", v.hash},
           {"asset_name", v.asset_name},
           {"size", v.size},
           {"timestamp", v.timestamp},
           {"uploaded", v.uploaded}};
}

void from_json(const json &j, FileVersion &v) {
  j.at("hash").get_to(v.hash);
  j.at("asset_name").get_to(v.asset_name);
  j.at("size").get_to(v.size);
  j.at("timestamp").get_to(v.timestamp);
  v.uploaded = j.value("uploaded", true);
}

void to_json(json &j, const FileRecord &r) {
  j = json{{"current_hash", r.current_hash}, {"versions", r.versions}};
}

void from_json(const json &j, FileRecord &r) {
  j.at("current_hash").get_to(r.current_hash);
  r.versions.clear();
  if (const auto it = j.find("versions"); it != j.end())
    it->get_to(r.versions);
}

Manifest::Manifest(std::filesystem::path manifest_path, std::string release_tag, Clock clock)
    : path_(std::move(manifest_path)), release_tag_(std::move(release_tag)),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })),
      last_updated_(now_string()) {}

std::string Manifest::now_string() const { return timeutil::iso8601_utc(clock_()); }

std::string Manifest::last_updated() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_updated_;
}

void Manifest::load() {
  std::map<std::string, FileRecord> files;
  std::string last_updated = now_string();

  if (fs::exists(path_)) {
    try {
      const json doc = json::parse(fs::read_text(path_));
      if (!doc.is_object())
        throw ParseError("manifest is not a JSON object");
      if (const auto it = doc.find("files"); it != doc.end())
        it->get_to(files);
      last_updated = doc.value("last_updated", last_updated);
      LOGI("Loaded manifest: %zu files", files.size());
    } catch (const std::exception &e) {
      LOGE("Failed to load manifest %s: %s, using empty manifest", path_.c_str(), e.what());
      files.clear();
      last_updated = now_string();
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  files_ = std::move(files);
  last_updated_ = std::move(last_updated);
}

void Manifest::save() {
  std::string text;
  {
    std::lock_guard<std::mutex> lock(mu_);
    last_updated_ = now_string();
    const json doc = {{"version", consts::kManifestVersion},
                      {"last_updated", last_updated_},
                      {"release_tag", release_tag_},
                      {"files", files_}};
    text = doc.dump(2) + "\n";
  }
  // Two savers racing write whole documents through distinct temp files; the
  // later rename wins.
  fs::write_text_atomic(path_, text);
}

std::optional<FileRecord> Manifest::get_record(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = files_.find(path);
  if (it == files_.end())
    return std::nullopt;
  return it->second;
}

bool Manifest::add_version(const std::string &path, const std::string &hash,
                           const std::string &asset_name, std::uintmax_t size, bool set_current) {
  std::lock_guard<std::mutex> lock(mu_);
  auto [it, inserted] = files_.try_emplace(path);
  FileRecord &record = it->second;

  const bool known = std::ranges::any_of(record.versions,
                                         [&](const FileVersion &v) { return v.hash == hash; });
  if (!known) {
    record.versions.push_back(FileVersion{.hash = hash,
                                          .asset_name = asset_name,
                                          .size = size,
                                          .timestamp = now_string(),
                                          .uploaded = true});
  }
  if (set_current || inserted)
    record.current_hash = hash;

  if (!known)
    LOGI("Added version for %s: %.23s...", path.c_str(), hash.c_str());
  return !known;
}

std::optional<FileVersion> Manifest::get_current_version(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = files_.find(path);
  if (it == files_.end() || it->second.versions.empty())
    return std::nullopt;
  const FileRecord &record = it->second;
  for (const auto &v : record.versions) {
    if (v.hash == record.current_hash)
      return v;
  }
  LOGW("current_hash of %s matches no version, falling back to the newest entry", path.c_str());
  return record.versions.back();
}

std::vector<FileVersion> Manifest::newest_first(const FileRecord &record) const {
  // Sort indices so equal timestamps keep "later append is newer".
  std::vector<std::size_t> order(record.versions.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  auto key = [&](std::size_t i) {
    return timeutil::parse_iso8601_utc(record.versions[i].timestamp).value_or(0);
  };
  std::ranges::sort(order, [&](std::size_t a, std::size_t b) {
    const auto ka = key(a);
    const auto kb = key(b);
    return ka != kb ? ka > kb : a > b;
  });
  std::vector<FileVersion> out;
  out.reserve(order.size());
  for (auto i : order)
    out.push_back(record.versions[i]);
  return out;
}

std::vector<FileVersion> Manifest::get_all_versions(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = files_.find(path);
  if (it == files_.end())
    return {};
  return newest_first(it->second);
}

std::vector<std::string> Manifest::cleanup_old_versions(const std::string &path, int keep) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = files_.find(path);
  const auto limit = static_cast<std::size_t>(std::max(keep, 0));
  if (it == files_.end() || it->second.versions.size() <= limit)
    return {};

  FileRecord &record = it->second;
  const auto sorted = newest_first(record);

  std::vector<std::string> removed;
  std::vector<std::string> kept_hashes;
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (i < limit)
      kept_hashes.push_back(sorted[i].hash);
    else
      removed.push_back(sorted[i].asset_name);
  }
  // Survivors keep their original append order.
  std::erase_if(record.versions, [&](const FileVersion &v) {
    return std::ranges::find(kept_hashes, v.hash) == kept_hashes.end();
  });

  LOGI("Cleaned up %zu old versions for %s", removed.size(), path.c_str());
  return removed;
}

std::map<std::string, std::vector<std::string>> Manifest::cleanup_all_old_versions(int keep) {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto &path : list_files()) {
    auto removed = cleanup_old_versions(path, keep);
    if (!removed.empty())
      out.emplace(path, std::move(removed));
  }
  return out;
}

std::vector<std::string> Manifest::remove_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = files_.find(path);
  if (it == files_.end())
    return {};
  std::vector<std::string> assets;
  for (const auto &v : it->second.versions)
    assets.push_back(v.asset_name);
  files_.erase(it);
  LOGI("Removed file from manifest: %s", path.c_str());
  return assets;
}

std::vector<std::string> Manifest::list_files() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(files_.size());
  for (const auto &[path, record] : files_)
    out.push_back(path);
  return out;
}

std::size_t Manifest::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return files_.size();
}

} // namespace lfsync
