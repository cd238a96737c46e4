#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  gitwatch::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    gitwatch::cli::print_usage();
    return gitwatch::cli::kExitUsage;
  }
  const std::string cmd = argv[1];
  if (cmd == "-h" || cmd == "--help" || cmd == "help") {
    gitwatch::cli::print_usage();
    return gitwatch::cli::kExitOk;
  }

  const auto fn = gitwatch::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    gitwatch::cli::print_usage();
    return gitwatch::cli::kExitUsage;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
