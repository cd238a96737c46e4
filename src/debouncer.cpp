#include "gitwatch/debouncer.hpp"

#include "gitwatch/log.hpp"

#include <algorithm>
#include <tuple>

namespace stdfs = std::filesystem;

namespace gitwatch {

Debouncer::Debouncer(std::chrono::milliseconds window, std::shared_ptr<const PathMatcher> matcher)
    : window_(window), matcher_(std::move(matcher)) {}

Debouncer::Entry &Debouncer::touch(const stdfs::path &p, State initial, Clock::time_point now) {
  auto [it, inserted] = entries_.try_emplace(p);
  if (inserted)
    it->second.state = initial;
  it->second.last = now;
  it->second.seq = ++seq_;
  return it->second;
}

void Debouncer::feed(RawEvent ev, Clock::time_point now) {
  switch (ev.kind) {
  case RawKind::Error: {
    std::string msg = ev.message;
    if (!ev.path.empty())
      msg += ": " + ev.path.string();
    errors_.push_back(WatchEvent::error(std::move(msg)));
    return;
  }
  case RawKind::Terminated:
    log::debug("debouncer: terminal event is handled by the orchestrator");
    return;
  default:
    break;
  }

  if (matcher_ && matcher_->is_ignored(ev.path, ev.is_dir)) {
    log::debug("ignored: ", ev.path.string());
    return;
  }

  switch (ev.kind) {
  case RawKind::RenamedFrom:
    move_out(ev.path, ev.cookie, now);
    break;
  case RawKind::RenamedTo:
    move_in(ev.path, ev.cookie, now);
    break;
  default:
    apply(ev.path, ev.kind, now);
    break;
  }
}

void Debouncer::apply(const stdfs::path &p, RawKind kind, Clock::time_point now) {
  auto it = entries_.find(p);
  if (it == entries_.end()) {
    switch (kind) {
    case RawKind::Created:
      touch(p, State::Create, now);
      break;
    case RawKind::Removed:
      touch(p, State::Delete, now);
      break;
    default:
      touch(p, State::Modify, now);
      break;
    }
    return;
  }

  Entry &e = it->second;
  e.last = now;
  e.seq = ++seq_;
  switch (kind) {
  case RawKind::Created:
  case RawKind::Modified:
    if (e.state == State::Delete)
      e.state = State::Modify; // recreated within the window
    break;
  case RawKind::Removed:
    if (e.state == State::Create) {
      entries_.erase(it); // net zero
    } else if (e.state == State::Rename) {
      const stdfs::path origin = e.from;
      entries_.erase(it);
      origin_gone(origin, p, now);
    } else {
      e.state = State::Delete;
    }
    break;
  default:
    break;
  }
}

// The content that once lived at `origin` (and was last seen at `via`) no longer exists.
void Debouncer::origin_gone(const stdfs::path &origin, const stdfs::path &via,
                            Clock::time_point now) {
  auto it = entries_.find(origin);
  if (it == entries_.end()) {
    touch(origin, State::Delete, now);
    return;
  }
  if (it->second.moved_to == via)
    it->second.moved_to.reset();
  it->second.last = now;
  it->second.seq = ++seq_;
}

void Debouncer::move_out(const stdfs::path &p, std::uint32_t cookie, Clock::time_point now) {
  OpenMove m{.cookie = cookie, .source = p, .origin = p, .was_created = false, .at = now};

  auto it = entries_.find(p);
  if (it != entries_.end() && it->second.state == State::Create) {
    m.was_created = true;
    entries_.erase(it);
  } else if (it != entries_.end() && it->second.state == State::Rename) {
    m.origin = it->second.from;
    entries_.erase(it);
  } else {
    Entry &e = touch(p, State::Delete, now);
    e.state = State::Delete;
  }
  moves_.push_back(std::move(m));
}

void Debouncer::move_in(const stdfs::path &q, std::uint32_t cookie, Clock::time_point now) {
  auto mit = moves_.end();
  if (cookie != 0) {
    mit = std::ranges::find_if(moves_, [&](const OpenMove &m) { return m.cookie == cookie; });
  } else {
    auto rit = std::ranges::find_if(moves_.rbegin(), moves_.rend(),
                                    [](const OpenMove &m) { return m.cookie == 0; });
    if (rit != moves_.rend())
      mit = std::next(rit).base();
  }
  if (mit == moves_.end()) {
    apply(q, RawKind::Created, now);
    return;
  }

  const OpenMove m = std::move(*mit);
  moves_.erase(mit);

  if (m.was_created) {
    // A temp file renamed into place reads as the destination appearing.
    apply(q, RawKind::Created, now);
    return;
  }
  if (m.origin == q) {
    Entry &e = touch(q, State::Modify, now);
    e.state = State::Modify;
    e.moved_to.reset();
    return;
  }

  if (auto oit = entries_.find(m.origin); oit != entries_.end())
    oit->second.moved_to = q;
  else
    touch(m.origin, State::Delete, now).moved_to = q;

  Entry &e = touch(q, State::Rename, now);
  e.state = State::Rename;
  e.from = m.origin;
  e.moved_to.reset();
}

void Debouncer::expire_moves(Clock::time_point now) {
  for (auto it = moves_.begin(); it != moves_.end();) {
    if (it->at + window_ > now) {
      ++it;
      continue;
    }
    // Unpaired: the source side already reads as deleted, except along a rename chain
    // where the original path still needs its deletion recorded.
    if (!it->was_created && it->origin != it->source)
      origin_gone(it->origin, it->source, it->at);
    it = moves_.erase(it);
  }
}

std::vector<WatchEvent> Debouncer::poll_ready(Clock::time_point now) {
  expire_moves(now);

  std::vector<WatchEvent> out = std::move(errors_);
  errors_.clear();

  std::vector<std::tuple<Clock::time_point, std::uint64_t, stdfs::path>> ready;
  for (const auto &[path, e] : entries_) {
    if (e.last + window_ <= now)
      ready.emplace_back(e.last, e.seq, path);
  }
  std::ranges::sort(ready);

  for (const auto &[last, seq, path] : ready) {
    auto it = entries_.find(path);
    const Entry &e = it->second;
    switch (e.state) {
    case State::Create:
      out.push_back(WatchEvent::created(path));
      break;
    case State::Modify:
      // The old content moved away and a new file took its place.
      out.push_back(e.moved_to ? WatchEvent::created(path) : WatchEvent::modified(path));
      break;
    case State::Delete:
      if (!e.moved_to)
        out.push_back(WatchEvent::deleted(path));
      break;
    case State::Rename:
      out.push_back(WatchEvent::renamed(e.from, path));
      break;
    }
    entries_.erase(it);
  }
  return out;
}

void Debouncer::discard_pending() {
  if (!entries_.empty() || !moves_.empty())
    log::debug("discarding ", entries_.size(), " pending paths");
  entries_.clear();
  moves_.clear();
}

} // namespace gitwatch
