#pragma once
#include "gitwatch/event.hpp"
#include "gitwatch/status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gitwatch {

// One enriched change, as handed to a Sink.
struct EventRecord {
  std::string event_type;               // created | modified | deleted | renamed
  std::string path;                     // destination for renames
  std::optional<std::string> from_path; // renames only
  std::optional<FileStatus> git_status;
  std::int64_t timestamp{0};            // seconds since epoch
};

// Repository-wide counters for heartbeats and the status command.
struct SummaryRecord {
  std::optional<std::string> branch;
  std::uint64_t ahead{0};
  std::uint64_t behind{0};
  std::uint64_t modified_files{0};
  std::uint64_t staged_files{0};
  std::uint64_t untracked_files{0};
  bool has_conflicts{false};

  bool operator==(const SummaryRecord&) const = default;
};

// `ev` must not be an Error event.
EventRecord make_event_record(const WatchEvent& ev, std::optional<FileStatus> status,
                              std::int64_t now);

// Modified counts Modified; staged counts Staged and Renamed; untracked counts Untracked.
SummaryRecord summarize(const RepoStatus& st);

} // namespace gitwatch
