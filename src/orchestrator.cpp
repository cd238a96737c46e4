#include "gitwatch/orchestrator.hpp"

#include "gitwatch/fs.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/time.hpp"

#include <vector>

namespace gitwatch {

Orchestrator::Orchestrator(OrchestratorOptions opts, EventSource &source, Debouncer &debouncer,
                           std::shared_ptr<const PathMatcher> matcher, StatusCache *cache,
                           Sink &sink, CancellationToken token)
    : opts_(std::move(opts)), source_(source), debouncer_(debouncer), matcher_(std::move(matcher)),
      cache_(cache), sink_(sink), token_(std::move(token)), repo_root_(opts_.repo_root) {
  if (!opts_.clock)
    opts_.clock = [] { return timeutil::now_seconds(); };
}

RunState Orchestrator::run() {
  if (token_.cancelled()) {
    state_ = RunState::Stopped;
    return state_;
  }
  state_ = RunState::Running;
  source_.start();
  auto &queue = source_.events();

  while (!token_.cancelled()) {
    std::vector<RawEvent> batch;
    if (auto first = queue.pop_for(opts_.tick))
      batch.push_back(std::move(*first));
    for (auto &ev : queue.drain())
      batch.push_back(std::move(ev));

    for (auto &ev : batch) {
      if (ev.kind == RawKind::Terminated) {
        finish_fatal(ev.message);
        return state_;
      }
      debouncer_.feed(std::move(ev));
    }
    if (batch.empty() && queue.closed()) {
      finish_fatal("event channel closed");
      return state_;
    }

    bool sent = false;
    for (const auto &ev : debouncer_.poll_ready())
      sent = handle(ev) || sent;
    if (!sent && batch.empty())
      heartbeat();
  }

  state_ = RunState::Draining;
  for (const auto &ev : debouncer_.poll_ready())
    handle(ev);
  debouncer_.discard_pending();
  source_.stop();
  state_ = RunState::Stopped;
  log::debug("stopped after ", emitted_, " events");
  return state_;
}

void Orchestrator::finish_fatal(const std::string &why) {
  state_ = RunState::Stopped;
  failed_ = true;
  source_.stop();
  sink_.on_fatal(FatalWatchError(why));
}

bool Orchestrator::handle(const WatchEvent &ev) {
  if (ev.kind() == WatchKind::Error) {
    sink_.on_error(ev.message());
    return true;
  }
  if (matcher_ && matcher_->is_ignored(*ev.path()))
    return false;

  sink_.on_event(make_event_record(ev, status_for(ev), opts_.clock()));
  ++emitted_;
  return true;
}

std::optional<FileStatus> Orchestrator::status_for(const WatchEvent &ev) {
  if (!cache_)
    return std::nullopt;
  const auto path = *ev.path();
  if (repo_root_ && !fs::is_within(path, *repo_root_))
    return std::nullopt;

  // Without a tracked repository the cached "no repository" result stands for its TTL.
  if (repo_root_)
    cache_->invalidate();
  const auto snap = cache_->get();
  if (!snap)
    return std::nullopt;
  if (!repo_root_) {
    repo_root_ = snap->workdir;
    log::info("tracking repository at ", repo_root_->string());
    if (!fs::is_within(path, *repo_root_))
      return std::nullopt;
  }

  const auto rel = path.lexically_relative(snap->workdir).generic_string();
  if (auto st = snap->lookup(rel))
    return st;
  if (ev.kind() != WatchKind::Deleted && fs::exists(path))
    return FileStatus::Untracked;
  return std::nullopt;
}

void Orchestrator::heartbeat() {
  if (!opts_.heartbeat || !cache_)
    return;
  const auto snap = cache_->get();
  if (!snap || snap->file_statuses.empty())
    return;
  auto rec = summarize(*snap);
  if (last_summary_ && *last_summary_ == rec)
    return;
  sink_.on_summary(rec);
  last_summary_ = std::move(rec);
}

} // namespace gitwatch
