#include "cli/args.hpp"
#include "gitwatch/config.hpp"
#include "gitwatch/errors.hpp"

#include "repo_fixture.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitwatch::ConfigError;
using gitwatch::WatchConfig;
using ms = std::chrono::milliseconds;

static WatchConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "watch");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  return gitwatch::cli::parse_watch_args(static_cast<int>(argv.size()), argv.data());
}

template <class F> static bool throws_config(F &&f) {
  try {
    f();
  } catch (const ConfigError &) {
    return true;
  }
  return false;
}

int main() {
  fixture::TempDir tmp("config");
  try {
    const auto root = fixture::fs::canonical(tmp.path);

    // Defaults
    {
      const auto cfg = parse({root.string()});
      if (cfg.root != root || cfg.debounce != ms(100) || cfg.ttl != ms(500) ||
          cfg.format != gitwatch::OutputFormat::Json || cfg.git != gitwatch::GitMode::Auto ||
          !cfg.recursive || cfg.max_depth || cfg.heartbeat || !cfg.use_ignore_file) {
        std::cerr << "defaults\n";
        return 1;
      }
      gitwatch::validate(cfg);
    }

    // Flags
    {
      const auto cfg = parse({"-f", "summary", "-i", "250", "--ignore", "*.log", "--ignore",
                              "tmp/", "--no-git", "--depth", "3", "--heartbeat", "-vv",
                              root.string()});
      if (cfg.format != gitwatch::OutputFormat::Summary || cfg.debounce != ms(250) ||
          cfg.extra_patterns != std::vector<std::string>{"*.log", "tmp/"} ||
          cfg.git != gitwatch::GitMode::Off || cfg.max_depth != 3u || cfg.heartbeat != true ||
          cfg.verbosity != gitwatch::log::Level::Debug) {
        std::cerr << "flags\n";
        return 1;
      }
    }
    if (!throws_config([&] { parse({"-f", "xml"}); })) { std::cerr << "bad format accepted\n"; return 1; }
    if (!throws_config([&] { parse({"-i", "-5"}); })) { std::cerr << "negative interval accepted\n"; return 1; }
    if (!throws_config([&] { parse({"--bogus"}); })) { std::cerr << "unknown flag accepted\n"; return 1; }
    if (!throws_config([&] { parse({"a", "b"}); })) { std::cerr << "two roots accepted\n"; return 1; }
    if (!throws_config([&] { parse({"--ttl"}); })) { std::cerr << "missing value accepted\n"; return 1; }

    // Config file, with flags taking precedence wherever --config appears
    const auto file = tmp.path / "gitwatch.conf";
    fixture::write_file(file, "# watch settings\n"
                              "debounce_ms: 40\n"
                              "ttl_ms: 1000\n"
                              "format: events\n"
                              "ignore: *.bak\n"
                              "ignore: cache/\n"
                              "gitignore: no\n"
                              "max_depth: 2\n"
                              "git: auto\n"
                              "\n"
                              "heartbeat: off\n");
    {
      const auto cfg = parse({root.string(), "-f", "pretty", "--config", file.string()});
      if (cfg.debounce != ms(40) || cfg.ttl != ms(1000) ||
          cfg.format != gitwatch::OutputFormat::Pretty || cfg.use_ignore_file ||
          cfg.extra_patterns.size() != 2 || cfg.max_depth != 2u || cfg.heartbeat != false) {
        std::cerr << "config file\n";
        return 1;
      }
    }

    fixture::write_file(file, "debounce_ms: 10\ncolour: red\n");
    try {
      WatchConfig cfg;
      gitwatch::load_config_file(file, cfg);
      std::cerr << "unknown key accepted\n";
      return 1;
    } catch (const ConfigError &e) {
      if (std::string(e.what()).find(":2:") == std::string::npos) {
        std::cerr << "error lacks a line number: " << e.what() << "\n";
        return 1;
      }
    }
    fixture::write_file(file, "recursive: maybe\n");
    if (!throws_config([&] {
          WatchConfig cfg;
          gitwatch::load_config_file(file, cfg);
        })) {
      std::cerr << "bad bool accepted\n";
      return 1;
    }
    if (!throws_config([&] {
          WatchConfig cfg;
          gitwatch::load_config_file(tmp.path / "absent.conf", cfg);
        })) {
      std::cerr << "missing config file accepted\n";
      return 1;
    }

    // Validation
    {
      WatchConfig cfg;
      cfg.root = root / "nope";
      if (!throws_config([&] { gitwatch::validate(cfg); })) { std::cerr << "missing root\n"; return 1; }
      cfg.root = file;
      if (!throws_config([&] { gitwatch::validate(cfg); })) { std::cerr << "file root\n"; return 1; }
      cfg.root = root;
      cfg.debounce = ms(0);
      if (!throws_config([&] { gitwatch::validate(cfg); })) { std::cerr << "zero debounce\n"; return 1; }
    }

    if (gitwatch::parse_git_mode("true") != gitwatch::GitMode::On ||
        gitwatch::parse_git_mode("auto") != gitwatch::GitMode::Auto || gitwatch::parse_git_mode("x")) {
      std::cerr << "git mode parsing\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "config OK\n";
  return 0;
}
