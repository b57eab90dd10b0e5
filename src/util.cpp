// String helpers for asset naming and path filtering
#include "lfsync/util.hpp"

#include "lfsync/consts.hpp"
#include "lfsync/hash.hpp"

#include <algorithm>
#include <cctype>

namespace lfsync {

bool looks_hex64(std::string_view str) {
  if (str.size() != consts::kSha256HexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string sanitize_filename(std::string_view filename) {
  auto allowed = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  };
  // Collapsing runs happens before the final character mapping, so names
  // stay identical to the ones already present in existing stores.
  std::string collapsed;
  collapsed.reserve(filename.size());
  for (char c : filename) {
    if (c == ' ' || c == '(' || c == ')') {
      c = '_';
    }
    if (c == '_' && !collapsed.empty() && collapsed.back() == '_') {
      continue;
    }
    collapsed.push_back(c);
  }
  std::string out;
  out.reserve(collapsed.size());
  for (char c : collapsed) {
    out.push_back(allowed(c) ? c : '_');
  }
  return out;
}

std::string asset_name_for(std::string_view hash, std::string_view filename) {
  const std::string_view hex = strip_hash_prefix(hash);
  return std::string(hex.substr(0, consts::kAssetHashPrefixLen)) + "-" +
         sanitize_filename(filename);
}

bool is_excluded(std::string_view rel_path, const std::vector<std::string> &excludes) {
  const std::string rel = strutil::strip_slashes(rel_path);
  for (const auto &ex : excludes) {
    const std::string exn = strutil::strip_slashes(ex);
    if (exn.empty()) {
      continue;
    }
    if (rel == exn || (rel.size() > exn.size() && rel.starts_with(exn) && rel[exn.size()] == '/')) {
      return true;
    }
  }
  return false;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_ws(std::string_view sv) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i])))
      ++i;
    std::size_t j = i;
    while (j < sv.size() && !std::isspace(static_cast<unsigned char>(sv[j])))
      ++j;
    if (j > i)
      out.emplace_back(sv.substr(i, j - i));
    i = j;
  }
  return out;
}

std::string strip_slashes(std::string_view sv) {
  while (sv.starts_with("./"))
    sv.remove_prefix(2);
  while (!sv.empty() && sv.front() == '/')
    sv.remove_prefix(1);
  while (!sv.empty() && sv.back() == '/')
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace lfsync
