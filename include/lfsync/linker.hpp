#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsync::linker {

// Make `link` a symlink to `target`. An existing symlink elsewhere, file or
// directory at `link` is replaced; a correct symlink is left alone.
void ensure_symlink(const std::filesystem::path &link, const std::filesystem::path &target);

// Create "<hist>/<rel>" for directory targets ("rel/") and the parent
// directory of file targets.
void precreate_dirlike(const std::filesystem::path &hist, const std::vector<std::string> &targets);

/**
 * Move every target from under `base` into `hist` and leave a symlink behind.
 *
 *  - directory: merged into the history copy without overwriting files
 *    already there, then replaced by the link
 *  - file: moved when the history has no copy yet, otherwise dropped in
 *    favour of the history copy
 *  - missing: created empty in the history ("rel/" as a directory)
 *
 * Failures are logged per target. Returns the number of targets linked.
 */
auto migrate_and_link(const std::filesystem::path &base, const std::filesystem::path &hist,
                      const std::vector<std::string> &targets) -> std::size_t;

// Write a .gitkeep into every empty directory below the targets in `hist`,
// skipping excluded paths and .git. Returns the number of files written.
auto track_empty_dirs(const std::filesystem::path &hist, const std::vector<std::string> &targets,
                      const std::vector<std::string> &excludes) -> std::size_t;

} // namespace lfsync::linker
