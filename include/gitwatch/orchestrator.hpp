#pragma once
#include "gitwatch/cancellation.hpp"
#include "gitwatch/consts.hpp"
#include "gitwatch/debouncer.hpp"
#include "gitwatch/event_source.hpp"
#include "gitwatch/path_matcher.hpp"
#include "gitwatch/records.hpp"
#include "gitwatch/sink.hpp"
#include "gitwatch/status_cache.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace gitwatch {

enum class RunState : std::uint8_t { Running, Draining, Stopped };

struct OrchestratorOptions {
  std::chrono::milliseconds tick{consts::kDefaultTick};
  bool heartbeat{false};
  // Working tree of the repository, when already known. Otherwise it is taken from the
  // first status snapshot the cache produces.
  std::optional<std::filesystem::path> repo_root;
  std::function<std::int64_t()> clock; // epoch seconds for records; defaults to now
};

/**
 * The control loop: source -> debouncer -> status enrichment -> sink.
 *
 * run() blocks on the calling thread until the token is cancelled or the source
 * terminates. Every tick it moves raw events into the debouncer, emits what is ready
 * and, when idle, may send a heartbeat summary. `cache` may be null (git disabled).
 */
class Orchestrator {
public:
  Orchestrator(OrchestratorOptions opts, EventSource &source, Debouncer &debouncer,
               std::shared_ptr<const PathMatcher> matcher, StatusCache *cache, Sink &sink,
               CancellationToken token);

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // Throws ConfigError when the source cannot start.
  RunState run();

  [[nodiscard]] RunState state() const { return state_.load(); }
  // True once the run ended on a terminal source condition.
  [[nodiscard]] bool failed() const { return failed_; }
  [[nodiscard]] std::uint64_t emitted() const { return emitted_; }

private:
  bool handle(const WatchEvent &ev);
  std::optional<FileStatus> status_for(const WatchEvent &ev);
  void heartbeat();
  void finish_fatal(const std::string &why);

  OrchestratorOptions opts_;
  EventSource &source_;
  Debouncer &debouncer_;
  std::shared_ptr<const PathMatcher> matcher_;
  StatusCache *cache_;
  Sink &sink_;
  CancellationToken token_;

  std::optional<std::filesystem::path> repo_root_;
  std::optional<SummaryRecord> last_summary_;
  std::atomic<RunState> state_{RunState::Running};
  bool failed_{false};
  std::uint64_t emitted_{0};
};

} // namespace gitwatch
