#pragma once
#include <string>
#include "cli/command.hpp"

namespace gitwatch::cli {

// Exit codes shared by all commands
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitwatch::cli
