#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lfsync::fs {

bool exists(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Unique sibling path "<p>.lfsync-<random>.tmp" for staging a replacement of p.
std::filesystem::path temp_path_beside(const std::filesystem::path& p);

// Best-effort delete; never throws.
void remove_quietly(const std::filesystem::path& p) noexcept;

// Rename src over dst; falls back to remove+rename where rename refuses to replace.
void replace_file(const std::filesystem::path& src, const std::filesystem::path& dst);

// Path of p relative to root using '/' separators ("a/b/c.bin").
std::string relative_generic(const std::filesystem::path& p, const std::filesystem::path& root);

} // namespace lfsync::fs
