#include "cli/args.hpp"

#include "gitwatch/errors.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <string>

namespace gitwatch::cli {

namespace {

std::uint64_t to_uint(std::string_view flag, std::string_view v) {
  std::uint64_t out = 0;
  const auto *end = v.data() + v.size();
  const auto [ptr, ec] = std::from_chars(v.data(), end, out);
  if (v.empty() || ec != std::errc{} || ptr != end)
    throw ConfigError(std::string(flag) + ": expected a non-negative integer, got '" +
                      std::string(v) + "'");
  return out;
}

} // namespace

WatchConfig parse_watch_args(int argc, char **argv) {
  WatchConfig cfg;

  // --config first, wherever it appears
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "--config") {
      if (i + 1 >= argc)
        throw ConfigError("--config: missing file");
      load_config_file(argv[i + 1], cfg);
    }
  }

  std::string path;
  int verbose = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    auto value = [&]() -> std::string_view {
      if (i + 1 >= argc)
        throw ConfigError(std::string(a) + ": missing value");
      return argv[++i];
    };

    if (a == "-f" || a == "--format") {
      const auto v = value();
      const auto f = parse_format(v);
      if (!f)
        throw ConfigError("invalid output format '" + std::string(v) +
                          "' (use json, pretty, events or summary)");
      cfg.format = *f;
    } else if (a == "-i" || a == "--interval") {
      cfg.debounce = std::chrono::milliseconds(to_uint(a, value()));
    } else if (a == "--ttl") {
      cfg.ttl = std::chrono::milliseconds(to_uint(a, value()));
    } else if (a == "--tick") {
      cfg.tick = std::chrono::milliseconds(to_uint(a, value()));
    } else if (a == "--git") {
      cfg.git = GitMode::On;
    } else if (a == "--no-git") {
      cfg.git = GitMode::Off;
    } else if (a == "--ignore") {
      cfg.extra_patterns.emplace_back(value());
    } else if (a == "--no-gitignore") {
      cfg.use_ignore_file = false;
    } else if (a == "--no-default-excludes") {
      cfg.use_default_excludes = false;
    } else if (a == "--depth") {
      const auto d = to_uint(a, value());
      if (d > UINT32_MAX)
        throw ConfigError("--depth: value too large");
      if (d == 0)
        cfg.max_depth.reset();
      else
        cfg.max_depth = static_cast<std::uint32_t>(d);
    } else if (a == "--no-recursive") {
      cfg.recursive = false;
    } else if (a == "--heartbeat") {
      cfg.heartbeat = true;
    } else if (a == "--no-heartbeat") {
      cfg.heartbeat = false;
    } else if (a == "--config") {
      ++i; // already applied
    } else if (a == "-v" || a == "-vv") {
      verbose += static_cast<int>(a.size()) - 1;
    } else if (!a.empty() && a[0] == '-') {
      throw ConfigError("unknown option: " + std::string(a));
    } else if (path.empty()) {
      path = std::string(a);
    } else {
      throw ConfigError("unexpected argument: " + std::string(a));
    }
  }

  if (verbose == 1)
    cfg.verbosity = log::Level::Info;
  else if (verbose >= 2)
    cfg.verbosity = log::Level::Debug;

  std::error_code ec;
  const std::filesystem::path root =
      path.empty() ? std::filesystem::path(".") : std::filesystem::path(path);
  const auto canon = std::filesystem::canonical(root, ec);
  cfg.root = ec ? std::filesystem::absolute(root) : canon;
  return cfg;
}

} // namespace gitwatch::cli
