#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lfsync::worktree {

// Regular files under root as root-relative '/'-separated paths, sorted.
// .git and .lfs directories are skipped; symlinks are not followed.
auto enumerate_files(const std::filesystem::path &root) -> std::vector<std::string>;

// Same walk, keeping only the paths `keep` accepts.
auto enumerate_files(const std::filesystem::path &root,
                     const std::function<bool(const std::string &rel,
                                              const std::filesystem::directory_entry &)> &keep)
    -> std::vector<std::string>;

} // namespace lfsync::worktree
