#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace lfsync {

// Validate 64-char lowercase/uppercase hex
auto looks_hex64(std::string_view str) -> bool;

// Make a filename safe for use as a store asset name:
// spaces and parentheses become '_', runs of '_' collapse, and anything
// outside [A-Za-z0-9._-] becomes '_'.
auto sanitize_filename(std::string_view filename) -> std::string;

// "<first 12 hex of hash>-<sanitized filename>". Accepts a tagged or bare hash.
auto asset_name_for(std::string_view hash, std::string_view filename) -> std::string;

// Prefix match on '/'-separated relative paths: "a/b" excludes "a/b" and "a/b/...".
auto is_excluded(std::string_view rel_path, const std::vector<std::string> &excludes) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);
  auto trim(std::string_view sv) -> std::string;
  // Split on runs of whitespace, dropping empties
  auto split_ws(std::string_view sv) -> std::vector<std::string>;
  auto strip_slashes(std::string_view sv) -> std::string;
}

}
