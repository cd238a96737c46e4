#pragma once
#include "gitwatch/status.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace gitwatch {

/**
 * Time-to-live cache in front of a slow, blocking status query.
 *
 * get() serves the stored snapshot while it is younger than `ttl`; otherwise it runs
 * `fetch` on the calling thread and stores the outcome. The lock is held across the
 * fetch, so concurrent callers wait for the one refresh in flight instead of starting
 * their own, and nobody observes a half-written snapshot.
 *
 * A failing fetch is remembered as "absent" until the TTL runs out again. When there is
 * no repository at all that is an expected outcome, not an error: it is re-checked every
 * TTL so a repository created later is picked up.
 */
class StatusCache {
public:
  using Clock = std::chrono::steady_clock;
  using Fetch = std::function<RepoStatus()>;
  using Now = std::function<Clock::time_point()>;

  StatusCache(std::chrono::milliseconds ttl, Fetch fetch, Now now = &Clock::now);

  StatusCache(const StatusCache &) = delete;
  StatusCache &operator=(const StatusCache &) = delete;

  [[nodiscard]] std::optional<RepoStatus> get();

  // The next get() refreshes regardless of age.
  void invalidate();

  // Last stored snapshot; never refreshes.
  [[nodiscard]] std::optional<RepoStatus> peek() const;

  [[nodiscard]] std::uint64_t fetch_count() const;
  [[nodiscard]] std::chrono::milliseconds ttl() const { return ttl_; }

private:
  struct CachedStatus {
    std::optional<RepoStatus> value;
    Clock::time_point captured_at{};
    bool valid{false}; // false until the first fetch and after invalidate()
  };

  std::chrono::milliseconds ttl_;
  Fetch fetch_;
  Now now_;

  mutable std::mutex mu_;
  CachedStatus cached_;
  std::uint64_t fetches_{0};
};

} // namespace gitwatch
