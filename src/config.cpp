#include "gitwatch/config.hpp"

#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/util.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace gitwatch {

namespace {

std::optional<std::uint64_t> parse_uint(std::string_view sv) {
  std::uint64_t v = 0;
  const auto *end = sv.data() + sv.size();
  const auto [ptr, ec] = std::from_chars(sv.data(), end, v);
  if (ec != std::errc{} || ptr != end || sv.empty())
    return std::nullopt;
  return v;
}

std::optional<bool> parse_bool(std::string_view sv) {
  if (sv == "true" || sv == "yes" || sv == "on" || sv == "1")
    return true;
  if (sv == "false" || sv == "no" || sv == "off" || sv == "0")
    return false;
  return std::nullopt;
}

} // namespace

std::optional<OutputFormat> parse_format(std::string_view s) {
  if (s == "json")
    return OutputFormat::Json;
  if (s == "pretty")
    return OutputFormat::Pretty;
  if (s == "events")
    return OutputFormat::Events;
  if (s == "summary")
    return OutputFormat::Summary;
  return std::nullopt;
}

std::string_view to_string(OutputFormat f) {
  switch (f) {
  case OutputFormat::Json:
    return "json";
  case OutputFormat::Pretty:
    return "pretty";
  case OutputFormat::Events:
    return "events";
  case OutputFormat::Summary:
    return "summary";
  }
  return "json";
}

std::optional<GitMode> parse_git_mode(std::string_view s) {
  if (s == "auto")
    return GitMode::Auto;
  if (const auto b = parse_bool(s))
    return *b ? GitMode::On : GitMode::Off;
  return std::nullopt;
}

void load_config_file(const std::filesystem::path &file, WatchConfig &cfg) {
  const auto text = fs::read_text(file);
  if (!text)
    throw ConfigError("config file not found: " + file.string());

  std::istringstream iss(*text);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    const std::string trimmed = strutil::trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue; // allow comments

    const auto where = file.string() + ":" + std::to_string(line_no);
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos)
      throw ConfigError(where + ": expected 'key: value'");
    const std::string key = strutil::trim(std::string_view(trimmed).substr(0, colon));
    const std::string value = strutil::trim(std::string_view(trimmed).substr(colon + 1));

    const auto bad = [&]() { return ConfigError(where + ": bad value for " + key + ": '" + value + "'"); };
    const auto as_ms = [&]() {
      const auto v = parse_uint(value);
      if (!v)
        throw bad();
      return std::chrono::milliseconds(static_cast<std::int64_t>(*v));
    };
    const auto as_bool = [&]() {
      const auto v = parse_bool(value);
      if (!v)
        throw bad();
      return *v;
    };

    if (key == "debounce_ms") {
      cfg.debounce = as_ms();
    } else if (key == "ttl_ms") {
      cfg.ttl = as_ms();
    } else if (key == "tick_ms") {
      cfg.tick = as_ms();
    } else if (key == "gitignore") {
      cfg.use_ignore_file = as_bool();
    } else if (key == "default_excludes") {
      cfg.use_default_excludes = as_bool();
    } else if (key == "ignore") {
      if (value.empty())
        throw bad();
      cfg.extra_patterns.push_back(value);
    } else if (key == "recursive") {
      cfg.recursive = as_bool();
    } else if (key == "max_depth") {
      const auto v = parse_uint(value);
      if (!v || *v > UINT32_MAX)
        throw bad();
      if (*v == 0)
        cfg.max_depth.reset(); // 0 = unlimited
      else
        cfg.max_depth = static_cast<std::uint32_t>(*v);
    } else if (key == "git") {
      const auto m = parse_git_mode(value);
      if (!m)
        throw bad();
      cfg.git = *m;
    } else if (key == "heartbeat") {
      cfg.heartbeat = as_bool();
    } else if (key == "format") {
      const auto f = parse_format(value);
      if (!f)
        throw bad();
      cfg.format = *f;
    } else {
      throw ConfigError(where + ": unknown key '" + key + "'");
    }
  }
}

void validate(const WatchConfig &cfg) {
  if (cfg.root.empty())
    throw ConfigError("no watch root given");
  if (!fs::exists(cfg.root))
    throw ConfigError("watch root does not exist: " + cfg.root.string());
  if (!fs::is_directory(cfg.root))
    throw ConfigError("watch root is not a directory: " + cfg.root.string());
  if (cfg.debounce.count() <= 0)
    throw ConfigError("debounce window must be positive");
  if (cfg.tick.count() <= 0)
    throw ConfigError("tick interval must be positive");
}

} // namespace gitwatch
