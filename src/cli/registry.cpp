#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <vector>

namespace lfsync::cli {

namespace {

struct entry {
  std::string name;
  command_fn fn;
  std::string help;
};

// Registration order is the order shown by print_usage().
std::vector<entry> &table() {
  static std::vector<entry> t;
  return t;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  if (it != t.end())
    *it = entry{.name = name, .fn = fn, .help = help};
  else
    t.push_back(entry{.name = name, .fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  return it == t.end() ? nullptr : it->fn;
}

void print_usage() {
  std::size_t width = 0;
  for (const auto &e : table())
    width = std::max(width, e.name.size());

  std::cerr << "usage: lfsync <command> [args]\n\ncommands:\n";
  for (const auto &e : table())
    std::cerr << "  " << std::left << std::setw(static_cast<int>(width)) << e.name << "  "
              << e.help << "\n";
  std::cerr << "\nSettings come from the environment (HIST_DIR, GITHUB_REPO, GITHUB_PAT, LFS_*)\n"
               "and <HIST_DIR>/sync-config.json.\n"
               "daemon, sync, offload, restore and cleanup take <HIST_DIR>/.lfs/lfsync.lock;\n"
               "only one of them can work on a clone at a time, so stop the daemon first.\n";
}

} // namespace lfsync::cli
