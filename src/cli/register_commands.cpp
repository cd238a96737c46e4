#include "cli/registry.hpp"

int cmd_watch(int argc, char **argv);
int cmd_status(int, char **);

namespace gitwatch::cli {

void register_all_commands() {
  register_command("watch", ::cmd_watch,
                   "Stream debounced changes with git status: gitwatch watch [path] [options]");
  register_command("status", ::cmd_status,
                   "Print the repository status once: gitwatch status [path] [-f format]");
}

} // namespace gitwatch::cli
