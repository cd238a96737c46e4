#include "gitwatch/records.hpp"

#include <stdexcept>

namespace gitwatch {

EventRecord make_event_record(const WatchEvent &ev, std::optional<FileStatus> status,
                              std::int64_t now) {
  if (ev.kind() == WatchKind::Error)
    throw std::invalid_argument("make_event_record: error events have no record");
  EventRecord r;
  r.event_type = std::string(ev.type_name());
  r.path = ev.path()->string();
  if (ev.kind() == WatchKind::Renamed)
    r.from_path = ev.from().string();
  r.git_status = status;
  r.timestamp = now;
  return r;
}

SummaryRecord summarize(const RepoStatus &st) {
  SummaryRecord s;
  if (!st.branch.empty())
    s.branch = st.branch;
  s.ahead = st.ahead;
  s.behind = st.behind;
  s.has_conflicts = st.has_conflicts;
  for (const auto &[path, fs] : st.file_statuses) {
    switch (fs) {
    case FileStatus::Modified:
      ++s.modified_files;
      break;
    case FileStatus::Staged:
    case FileStatus::Renamed:
      ++s.staged_files;
      break;
    case FileStatus::Untracked:
      ++s.untracked_files;
      break;
    default:
      break;
    }
  }
  return s;
}

} // namespace gitwatch
