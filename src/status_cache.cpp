#include "gitwatch/status_cache.hpp"

#include "gitwatch/errors.hpp"
#include "gitwatch/log.hpp"

namespace gitwatch {

StatusCache::StatusCache(std::chrono::milliseconds ttl, Fetch fetch, Now now)
    : ttl_(ttl), fetch_(std::move(fetch)), now_(std::move(now)) {}

std::optional<RepoStatus> StatusCache::get() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_();
  if (cached_.valid && now - cached_.captured_at < ttl_)
    return cached_.value;

  std::optional<RepoStatus> fresh;
  ++fetches_;
  try {
    fresh = fetch_();
  } catch (const NoRepositoryError &e) {
    log::debug("status: ", e.what());
  } catch (const std::exception &e) {
    log::warn("status query failed: ", e.what());
  }

  // Replace as a whole; readers only ever see a complete snapshot or none.
  cached_.value = std::move(fresh);
  cached_.captured_at = now_();
  cached_.valid = true;
  return cached_.value;
}

void StatusCache::invalidate() {
  std::lock_guard<std::mutex> lock(mu_);
  cached_.valid = false;
}

std::optional<RepoStatus> StatusCache::peek() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cached_.value;
}

std::uint64_t StatusCache::fetch_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fetches_;
}

} // namespace gitwatch
