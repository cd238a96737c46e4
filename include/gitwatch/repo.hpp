#pragma once
#include "gitwatch/consts.hpp"
#include "gitwatch/hash.hpp"
#include "gitwatch/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitwatch {

struct TreeEntry {
  std::uint32_t mode; // e.g. consts::kModeFile, consts::kModeTree (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

/**
 * Read-only view of one git repository: a working tree plus its git directory.
 *
 * Linked worktrees keep HEAD and the index in their own git directory and share refs
 * and objects through the "commondir" file; common_dir() points at the shared part.
 */
class Repository {
public:
  Repository(std::filesystem::path workdir, std::filesystem::path git_dir);

  Repository(Repository &&) noexcept = default;
  Repository &operator=(Repository &&) noexcept = default;

  // Walk upward from `start` looking for ".git" (a directory or a "gitdir: <path>"
  // file). std::nullopt when the filesystem root is reached without a match.
  static auto discover(const std::filesystem::path &start) -> std::optional<Repository>;

  // Core paths
  [[nodiscard]] const std::filesystem::path &workdir() const { return workdir_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir_ / consts::kHeadFile;
  }
  [[nodiscard]] auto index_file() const -> std::filesystem::path {
    return git_dir_ / consts::kIndexFile;
  }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kObjectsDir;
  }

  [[nodiscard]] const ObjectStore &objects() const { return *store_; }

  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::int64_t commit_time{0};      // committer timestamp, seconds since epoch
  };

  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Commits reachable from `local` but not `upstream` (first) and the reverse (second).
  [[nodiscard]] auto ahead_behind(std::string_view local_hex, std::string_view upstream_hex) const
      -> std::pair<std::uint64_t, std::uint64_t>;

private:
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path workdir_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
  std::unique_ptr<ObjectStore> store_;
};

} // namespace gitwatch
