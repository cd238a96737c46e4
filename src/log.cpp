#include "gitwatch/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace gitwatch::log {

namespace {
std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::mutex g_write_mutex;

const char *label(Level l) {
  switch (l) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warning";
  case Level::Error:
    return "error";
  case Level::Off:
    break;
  }
  return "";
}
} // namespace

void set_level(Level l) { g_level.store(static_cast<int>(l)); }

Level level() { return static_cast<Level>(g_level.load()); }

void write(Level l, std::string_view message) {
  // Reader thread and orchestrator both log; keep lines whole.
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << "gitwatch: " << label(l) << ": " << message << '\n';
}

} // namespace gitwatch::log
