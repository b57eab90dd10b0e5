#pragma once

namespace lfsync::cli {

// Subcommand entry point; argv[0] is the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace lfsync::cli
