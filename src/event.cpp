#include "gitwatch/event.hpp"

namespace gitwatch {

std::string_view to_string(WatchKind kind) {
  switch (kind) {
  case WatchKind::Created:
    return "created";
  case WatchKind::Modified:
    return "modified";
  case WatchKind::Deleted:
    return "deleted";
  case WatchKind::Renamed:
    return "renamed";
  case WatchKind::Error:
    return "error";
  }
  return "error";
}

std::string_view WatchEvent::type_name() const { return to_string(kind_); }

} // namespace gitwatch
