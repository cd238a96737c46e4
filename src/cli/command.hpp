#pragma once

namespace gitwatch::cli {

// Subcommand entry point; argv[0] is the subcommand name. Returns the exit code.
using command_fn = int (*)(int, char **);

} // namespace gitwatch::cli
