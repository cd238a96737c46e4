#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gitwatch {

enum class RawKind : std::uint8_t {
  Created,
  Modified,
  Removed,
  RenamedFrom,
  RenamedTo,
  Error,      // single-path failure; the stream continues
  Terminated, // final sentinel: the watched root is gone
};

// One notification as delivered by the platform, before any coalescing.
struct RawEvent {
  RawKind kind{RawKind::Modified};
  std::filesystem::path path;
  std::uint32_t cookie{0}; // pairs RenamedFrom with RenamedTo; 0 when unknown
  bool is_dir{false};
  std::string message;     // Error / Terminated only

  static RawEvent created(std::filesystem::path p, bool dir = false) {
    return RawEvent{.kind = RawKind::Created, .path = std::move(p), .is_dir = dir};
  }
  static RawEvent modified(std::filesystem::path p) {
    return RawEvent{.kind = RawKind::Modified, .path = std::move(p)};
  }
  static RawEvent removed(std::filesystem::path p, bool dir = false) {
    return RawEvent{.kind = RawKind::Removed, .path = std::move(p), .is_dir = dir};
  }
  static RawEvent renamed_from(std::filesystem::path p, std::uint32_t cookie, bool dir = false) {
    return RawEvent{.kind = RawKind::RenamedFrom, .path = std::move(p), .cookie = cookie,
                    .is_dir = dir};
  }
  static RawEvent renamed_to(std::filesystem::path p, std::uint32_t cookie, bool dir = false) {
    return RawEvent{.kind = RawKind::RenamedTo, .path = std::move(p), .cookie = cookie,
                    .is_dir = dir};
  }
  static RawEvent error(std::string msg, std::filesystem::path p = {}) {
    return RawEvent{.kind = RawKind::Error, .path = std::move(p), .message = std::move(msg)};
  }
  static RawEvent terminated(std::string msg) {
    return RawEvent{.kind = RawKind::Terminated, .message = std::move(msg)};
  }
};

enum class WatchKind : std::uint8_t { Created, Modified, Deleted, Renamed, Error };

// The coalesced, semantic change that leaves the Debouncer.
class WatchEvent {
public:
  static WatchEvent created(std::filesystem::path p) { return {WatchKind::Created, {}, std::move(p), {}}; }
  static WatchEvent modified(std::filesystem::path p) { return {WatchKind::Modified, {}, std::move(p), {}}; }
  static WatchEvent deleted(std::filesystem::path p) { return {WatchKind::Deleted, {}, std::move(p), {}}; }
  static WatchEvent renamed(std::filesystem::path from, std::filesystem::path to) {
    return {WatchKind::Renamed, std::move(from), std::move(to), {}};
  }
  static WatchEvent error(std::string message) { return {WatchKind::Error, {}, {}, std::move(message)}; }

  [[nodiscard]] WatchKind kind() const { return kind_; }

  // Subject path: the destination for renames, none for errors.
  [[nodiscard]] std::optional<std::filesystem::path> path() const {
    if (kind_ == WatchKind::Error)
      return std::nullopt;
    return path_;
  }
  // Source path of a rename; empty otherwise.
  [[nodiscard]] const std::filesystem::path &from() const { return from_; }
  [[nodiscard]] const std::string &message() const { return message_; }

  // "created" | "modified" | "deleted" | "renamed" | "error"
  [[nodiscard]] std::string_view type_name() const;

  bool operator==(const WatchEvent &) const = default;

private:
  WatchEvent(WatchKind k, std::filesystem::path from, std::filesystem::path path, std::string msg)
      : kind_(k), from_(std::move(from)), path_(std::move(path)), message_(std::move(msg)) {}

  WatchKind kind_;
  std::filesystem::path from_;
  std::filesystem::path path_;
  std::string message_;
};

std::string_view to_string(WatchKind kind);

} // namespace gitwatch
