#include "lfsync/pointer.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"
#include "lfsync/util.hpp"

#include <nlohmann/json.hpp>
#include <string_view>

using json = nlohmann::json;

namespace {

bool has_pointer_suffix(const std::filesystem::path &p) {
  return p.filename().string().ends_with(lfsync::consts::kPointerSuffix);
}

std::string required_string(const json &doc, const char *key, const std::filesystem::path &p) {
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_string())
    throw lfsync::ParseError("pointer " + p.string() + ": missing string field '" + key + "'");
  return it->get<std::string>();
}

} // namespace

namespace lfsync {

bool is_pointer(const std::filesystem::path &path) {
  if (!fs::is_regular_file(path))
    return false;
  if (has_pointer_suffix(path))
    return true;

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > consts::kPointerSniffMax)
    return false;

  try {
    const std::string text = fs::read_text(path);
    if (text.find(consts::kPointerType) == std::string::npos)
      return false;
    const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!doc.is_object())
      return false;
    const auto it = doc.find("type");
    return it != doc.end() && it->is_string() && it->get<std::string>() == consts::kPointerType;
  } catch (const std::exception &) {
    return false; // unreadable file is simply not a pointer
  }
}

PointerFile read_pointer(const std::filesystem::path &path) {
  std::string text;
  try {
    text = fs::read_text(path);
  } catch (const std::exception &e) {
    throw ParseError(std::string("pointer unreadable: ") + e.what());
  }

  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ParseError("pointer " + path.string() + " is not JSON: " + e.what());
  }
  if (!doc.is_object())
    throw ParseError("pointer " + path.string() + " is not a JSON object");

  const auto type = doc.find("type");
  if (type == doc.end() || !type->is_string() || type->get<std::string>() != consts::kPointerType)
    throw ParseError("pointer " + path.string() + ": type is not " +
                     std::string(consts::kPointerType));

  PointerFile out{};
  out.version = consts::kPointerVersion;
  if (const auto v = doc.find("version"); v != doc.end()) {
    if (!v->is_number_integer())
      throw ParseError("pointer " + path.string() + ": version is not an integer");
    out.version = v->get<int>();
  }
  out.hash = required_string(doc, "hash", path);
  const auto size = doc.find("size");
  if (size == doc.end() || !size->is_number_integer())
    throw ParseError("pointer " + path.string() + ": missing integer field 'size'");
  const auto signed_size = size->get<long long>();
  out.size = signed_size < 0 ? 0 : static_cast<std::uintmax_t>(signed_size);
  out.filename = required_string(doc, "filename", path);
  out.release_tag = required_string(doc, "release_tag", path);
  out.asset_name = required_string(doc, "asset_name", path);
  return out;
}

std::string format_pointer(const PointerFile &pointer) {
  nlohmann::ordered_json doc = nlohmann::ordered_json::object();
  doc["version"] = pointer.version;
  doc["type"] = std::string(consts::kPointerType);
  doc["hash"] = pointer.hash;
  doc["size"] = pointer.size;
  doc["filename"] = pointer.filename;
  doc["release_tag"] = pointer.release_tag;
  doc["asset_name"] = pointer.asset_name;
  return doc.dump(2) + "\n";
}

void write_pointer(const std::filesystem::path &path, const PointerFile &pointer) {
  fs::write_text_atomic(path, format_pointer(pointer));
}

bool validate(const PointerFile &pointer) {
  if (!pointer.hash.starts_with(consts::kHashPrefix) ||
      !looks_hex64(std::string_view(pointer.hash).substr(consts::kHashPrefix.size())))
    return false;
  if (pointer.size == 0)
    return false;
  if (pointer.filename.empty() || pointer.asset_name.empty())
    return false;
  if (pointer.release_tag.empty())
    return false;
  return true;
}

std::filesystem::path real_path_for(const std::filesystem::path &pointer_path) {
  if (!has_pointer_suffix(pointer_path))
    return pointer_path;
  std::string s = pointer_path.string();
  s.resize(s.size() - consts::kPointerSuffix.size());
  return std::filesystem::path(s);
}

std::filesystem::path pointer_path_for(const std::filesystem::path &real_path) {
  auto p = real_path;
  p += consts::kPointerSuffix;
  return p;
}

} // namespace lfsync
