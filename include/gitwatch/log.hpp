#pragma once
#include <sstream>
#include <string>
#include <string_view>

// Diagnostics on stderr as "gitwatch: <level>: <message>". Records go to stdout, never here.
namespace gitwatch::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level level);
Level level();

void write(Level level, std::string_view message);

template <typename... Args>
void emit(Level lvl, const Args &...args) {
  if (lvl < level())
    return;
  std::ostringstream os;
  (os << ... << args);
  write(lvl, os.str());
}

template <typename... Args> void debug(const Args &...args) { emit(Level::Debug, args...); }
template <typename... Args> void info(const Args &...args) { emit(Level::Info, args...); }
template <typename... Args> void warn(const Args &...args) { emit(Level::Warn, args...); }
template <typename... Args> void error(const Args &...args) { emit(Level::Error, args...); }

} // namespace gitwatch::log
