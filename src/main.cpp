#include "cli/registry.hpp"

#include "lfsync/log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
  lfsync::log_init("lfsync");
  if (const char *level = std::getenv("LFSYNC_LOG_LEVEL"))
    lfsync::log_set_level(lfsync::parse_log_level(level));

  lfsync::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    lfsync::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    lfsync::cli::print_usage();
    return 0;
  }

  const auto fn = lfsync::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    lfsync::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
