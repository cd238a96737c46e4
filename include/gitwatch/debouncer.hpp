#pragma once
#include "gitwatch/event.hpp"
#include "gitwatch/path_matcher.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace gitwatch {

/**
 * Coalesces raw events per path inside a sliding window.
 *
 * A path's window closes `window` after the last raw event fed for it; only then does
 * poll_ready() report it, as at most one WatchEvent. Editor save sequences (write a temp
 * file, rename over, delete the backup) collapse into a single event, and a path that is
 * created and removed within one window produces nothing.
 *
 * Renames are paired by cookie. A source without a matching destination within the
 * window is reported as Deleted, a destination without a source as Created.
 *
 * Not thread-safe; owned by the orchestrator thread.
 */
class Debouncer {
public:
  using Clock = std::chrono::steady_clock;

  explicit Debouncer(std::chrono::milliseconds window,
                     std::shared_ptr<const PathMatcher> matcher = nullptr);

  void feed(RawEvent ev) { feed(std::move(ev), Clock::now()); }
  void feed(RawEvent ev, Clock::time_point now);

  // Events whose window has elapsed at `now`, in window-closure order. Non-blocking.
  std::vector<WatchEvent> poll_ready() { return poll_ready(Clock::now()); }
  std::vector<WatchEvent> poll_ready(Clock::time_point now);

  // Drops every open window without emitting.
  void discard_pending();

  [[nodiscard]] std::size_t pending() const { return entries_.size() + moves_.size(); }
  [[nodiscard]] std::chrono::milliseconds window() const { return window_; }

private:
  enum class State : std::uint8_t { Create, Modify, Delete, Rename };

  struct Entry {
    State state{State::Modify};
    std::filesystem::path from;                   // Rename: original path
    std::optional<std::filesystem::path> moved_to; // content left for this path
    Clock::time_point last{};
    std::uint64_t seq{0};
  };

  struct OpenMove {
    std::uint32_t cookie{0};
    std::filesystem::path source;  // path the RenamedFrom named
    std::filesystem::path origin;  // where the content originally lived
    bool was_created{false};       // source was created inside the window
    Clock::time_point at{};
  };

  void apply(const std::filesystem::path &p, RawKind kind, Clock::time_point now);
  void move_out(const std::filesystem::path &p, std::uint32_t cookie, Clock::time_point now);
  void move_in(const std::filesystem::path &q, std::uint32_t cookie, Clock::time_point now);
  void origin_gone(const std::filesystem::path &origin, const std::filesystem::path &via,
                   Clock::time_point now);
  void expire_moves(Clock::time_point now);
  Entry &touch(const std::filesystem::path &p, State initial, Clock::time_point now);

  std::chrono::milliseconds window_;
  std::shared_ptr<const PathMatcher> matcher_;
  std::map<std::filesystem::path, Entry> entries_;
  std::vector<OpenMove> moves_;
  std::vector<WatchEvent> errors_;
  std::uint64_t seq_{0};
};

} // namespace gitwatch
