#include "cli/registry.hpp"

int cmd_daemon(int argc, char **argv);
int cmd_sync(int argc, char **argv);
int cmd_offload(int argc, char **argv);
int cmd_restore(int, char **);
int cmd_cleanup(int, char **);
int cmd_status(int, char **);
int cmd_verify(int, char **);

namespace lfsync::cli {

void register_all_commands() {
  register_command("daemon", ::cmd_daemon,
                   "Align, link, restore, then sync periodically until SIGINT/SIGTERM");
  register_command("sync", ::cmd_sync, "Run one pull/restore/offload/commit/push cycle");
  register_command("offload", ::cmd_offload,
                   "Offload large files: lfsync offload [<file>...] (default: scan)");
  register_command("restore", ::cmd_restore,
                   "Restore from pointers: lfsync restore [--no-verify] [<pointer>...]");
  register_command("cleanup", ::cmd_cleanup, "Apply version retention and delete old assets");
  register_command("status", ::cmd_status, "Show settings, manifest and startup progress");
  register_command("verify", ::cmd_verify,
                   "Check a pointer and its real file: lfsync verify <pointer>...");
}

} // namespace lfsync::cli
