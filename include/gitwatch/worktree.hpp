#pragma once
#include "gitwatch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gitwatch {

class Repository;   // fwd
class PathMatcher;  // fwd
struct IndexEntry;  // fwd

namespace worktree {

struct BlobRef {
  std::uint32_t mode{0};
  oid id{};
};

using PathBlobMap = std::map<std::string, BlobRef>; // repo-relative path -> blob

// Build path->blob map from a tree object (recursive). Submodule entries are kept with
// their commit id; they are never descended into.
auto tree_to_map(const Repository& repo, const std::string& tree_hex) -> PathBlobMap;

enum class WorkState : std::uint8_t { Unchanged, Modified, Deleted };

// Compare the working copy of a stage-0 entry against the index. Matching size and
// mtime skip hashing; otherwise the file (or symlink target) is hashed as a blob.
auto compare_with_index(const std::filesystem::path& workdir, const IndexEntry& entry)
    -> WorkState;

// Untracked, non-ignored paths under `workdir`. A directory holding no tracked path is
// reported once as "dir/" when it contains at least one visible file. ".git" is skipped.
auto collect_untracked(const std::filesystem::path& workdir,
                       const std::set<std::string>& tracked, const PathMatcher& ignore)
    -> std::vector<std::string>;

} // namespace worktree

} // namespace gitwatch
