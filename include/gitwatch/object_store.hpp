#pragma once
#include "gitwatch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

struct Object {
  std::string type;               // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

class PackFile; // fwd

/**
 * Read-only object database: loose objects under objects/xx/yyyy..., then every
 * packfile under objects/pack. Packs are opened on first use.
 */
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir);
  ~ObjectStore();

  ObjectStore(const ObjectStore &) = delete;
  ObjectStore &operator=(const ObjectStore &) = delete;

  // Read and inflate the object; throws RepositoryError when it is missing or corrupt.
  Object read(const oid &id) const;
  Object read(std::string_view hex_oid) const;

  [[nodiscard]] bool contains(const oid &id) const;

  // Get filesystem path for a loose object.
  std::filesystem::path path_for_oid(const oid &object_id) const;

private:
  void load_packs() const;

  std::filesystem::path objects_dir_;
  mutable bool packs_loaded_{false};
  mutable std::vector<std::unique_ptr<PackFile>> packs_;
};

} // namespace gitwatch
