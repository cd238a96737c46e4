#pragma once
#include "gitwatch/consts.hpp"
#include "gitwatch/log.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

enum class OutputFormat : std::uint8_t { Json, Pretty, Events, Summary };
enum class GitMode : std::uint8_t { Auto, On, Off };

std::optional<OutputFormat> parse_format(std::string_view s);
std::string_view to_string(OutputFormat f);

std::optional<GitMode> parse_git_mode(std::string_view s);

// Everything one watch run needs. Defaults match the command-line defaults.
struct WatchConfig {
  std::filesystem::path root;
  std::chrono::milliseconds debounce{consts::kDefaultDebounce};
  std::chrono::milliseconds ttl{consts::kDefaultTtl};
  std::chrono::milliseconds tick{consts::kDefaultTick};
  bool use_ignore_file{true};
  bool use_default_excludes{true};
  std::vector<std::string> extra_patterns;
  bool recursive{true};
  std::optional<std::uint32_t> max_depth; // absent = unlimited
  GitMode git{GitMode::Auto};
  std::optional<bool> heartbeat;         // absent = only in summary format
  OutputFormat format{OutputFormat::Json};
  log::Level verbosity{log::Level::Warn};
};

// Apply a "key: value" file on top of `cfg`. Blank lines and '#' comments are skipped;
// "ignore" may repeat. Throws ConfigError on an unreadable file, an unknown key or a bad
// value (the message names file and line).
void load_config_file(const std::filesystem::path& file, WatchConfig& cfg);

// Throws ConfigError for a missing or non-directory root or a zero debounce window or tick.
void validate(const WatchConfig& cfg);

} // namespace gitwatch
