#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitwatch {

enum class FileStatus : std::uint8_t {
  Modified,
  Added,
  Deleted,
  Renamed,
  Untracked,
  Conflicted,
  Staged,
};

// "M" "A" "D" "R" "?" "U"; Staged reads as "A" (added to the index).
std::string_view short_code(FileStatus s);

// Whole-repository snapshot produced by one status query.
struct RepoStatus {
  std::string branch;
  std::uint64_t ahead{0};
  std::uint64_t behind{0};
  std::map<std::string, FileStatus> file_statuses; // repo-relative, '/'-separated
  bool has_conflicts{false};
  std::filesystem::path workdir;                   // working tree the snapshot describes

  // Lookup for a path inside the working tree: exact entry, then an untracked parent
  // directory reported as "dir/".
  [[nodiscard]] std::optional<FileStatus> lookup(std::string_view rel) const;
};

class Repository; // fwd

// Compute the repository status: branch, divergence from origin, per-file state.
// Throws RepositoryError on unreadable or corrupt repository data.
auto compute_status(const Repository& repo) -> RepoStatus;

// Discover the repository containing `start` and compute its status.
// Throws NoRepositoryError when there is none.
auto compute_status_at(const std::filesystem::path& start) -> RepoStatus;

} // namespace gitwatch
