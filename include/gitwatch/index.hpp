#pragma once
#include "gitwatch/consts.hpp"
#include "gitwatch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

struct IndexEntry {
  std::uint32_t mode{0};     // e.g. consts::kModeFile
  oid id{};                  // blob id (20 bytes)
  std::string path;          // "dir/file", no leading '/'
  std::uint16_t stage{0};    // 0 normal, 1..3 during a conflicted merge
  std::uint32_t size{0};     // stat data, truncated to 32 bits as git stores it
  std::uint32_t mtime_s{0};
  std::uint32_t mtime_ns{0};
  bool intent_to_add{false}; // "git add -N"
  bool skip_worktree{false};
};

/**
 * Reader for the binary index ("DIRC", versions 2, 3 and 4).
 * Extensions after the entry table are skipped.
 */
class Index {
public:
  explicit Index(std::filesystem::path index_file);

  // Parse the index if it exists (no throw if missing). Throws RepositoryError when the
  // file is malformed.
  void load();

  // Parse an in-memory index image.
  void parse(std::span<const std::uint8_t> bytes);

  [[nodiscard]] const std::vector<IndexEntry>& entries() const { return entries_; }
  [[nodiscard]] std::uint32_t version() const { return version_; }

  // Stage-0 entries by path.
  std::map<std::string, const IndexEntry*> by_path() const;

private:
  std::filesystem::path index_file_;
  std::uint32_t version_{0};
  std::vector<IndexEntry> entries_;
};

} // namespace gitwatch
