#include "cli/registry.hpp"

#include <iostream>
#include <map>

namespace gitwatch::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: gitwatch <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
  std::cerr << "\nwatch options:\n"
               "  -f, --format <json|pretty|events|summary>  output format (default json)\n"
               "  -i, --interval <ms>     debounce window (default 100)\n"
               "  --ttl <ms>              status cache lifetime (default 500)\n"
               "  --tick <ms>             loop tick (default 100)\n"
               "  --git | --no-git        force status enrichment on or off (default auto)\n"
               "  --ignore <pattern>      extra ignore pattern, repeatable\n"
               "  --no-gitignore          do not read <path>/.gitignore\n"
               "  --no-default-excludes   do not exclude .git, build/, node_modules/, ...\n"
               "  --depth <n>             watch at most n directory levels (0 = unlimited)\n"
               "  --no-recursive          watch the top directory only\n"
               "  --heartbeat | --no-heartbeat  idle status summaries\n"
               "  --config <file>         read 'key: value' settings first\n"
               "  -v                      more diagnostics on stderr (repeat for debug)\n";
}

} // namespace gitwatch::cli
