#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace lfsync {

// Small JSON placeholder committed in place of an offloaded file.
struct PointerFile {
  int version;
  std::string hash;        // "sha256:<64 hex>"
  std::uintmax_t size;     // bytes of the real file
  std::string filename;    // basename of the real file
  std::string release_tag; // container the asset lives in
  std::string asset_name;  // authoritative name returned by the store
};

// True for regular files named "*.pointer", or small files (<= 2 KiB) whose
// JSON content carries "type": "lfs-pointer".
auto is_pointer(const std::filesystem::path &path) -> bool;

// Parse a pointer file. Throws ParseError on unreadable/non-JSON content,
// a wrong "type" discriminator, or a missing/ill-typed required field.
auto read_pointer(const std::filesystem::path &path) -> PointerFile;

// Serialize to the on-disk JSON document (2-space indented).
auto format_pointer(const PointerFile &pointer) -> std::string;

// Atomically write the pointer document, creating parent directories.
void write_pointer(const std::filesystem::path &path, const PointerFile &pointer);

// Gate that must pass before a restore: "sha256:" plus 64 hex digits, size > 0 and
// non-empty filename, asset name and release tag.
auto validate(const PointerFile &pointer) -> bool;

// "<dir>/model.bin.pointer" -> "<dir>/model.bin" (unchanged without the suffix)
auto real_path_for(const std::filesystem::path &pointer_path) -> std::filesystem::path;

// "<dir>/model.bin" -> "<dir>/model.bin.pointer"
auto pointer_path_for(const std::filesystem::path &real_path) -> std::filesystem::path;

} // namespace lfsync
