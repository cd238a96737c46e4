#pragma once
#include "gitwatch/hash.hpp"
#include "gitwatch/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

namespace gitwatch {

/**
 * One packfile and its version 2 index.
 *
 * The index is held in memory; pack entries are read from the .pack file on demand,
 * inflating only the entries a lookup touches. Delta chains are resolved iteratively:
 * OFS_DELTA bases within this pack, REF_DELTA bases through the owning ObjectStore.
 */
class PackFile {
public:
  // `idx_path` names the .idx file; the .pack beside it is opened as well.
  explicit PackFile(const std::filesystem::path &idx_path);

  [[nodiscard]] std::optional<std::uint64_t> find(const oid &id) const;
  [[nodiscard]] std::uint32_t object_count() const { return count_; }

  Object read_at(std::uint64_t offset, const ObjectStore &store) const;

private:
  struct EntryHeader {
    int type{0};
    std::uint64_t size{0};
    std::uint64_t data_offset{0}; // first byte of the zlib stream
    std::uint64_t base_offset{0}; // OFS_DELTA
    oid base_id{};                // REF_DELTA
  };

  EntryHeader read_header(std::uint64_t offset) const;
  std::vector<std::uint8_t> inflate_at(std::uint64_t offset, std::uint64_t size) const;

  std::filesystem::path pack_path_;
  std::vector<std::uint8_t> idx_;
  std::uint32_t count_{0};
  mutable std::ifstream pack_;
};

// Apply a git delta (copy/insert instruction stream) to `base`.
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta);

} // namespace gitwatch
