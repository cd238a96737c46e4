#include "gitwatch/object_store.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/pack.hpp"

#include <algorithm>
#include <stdexcept>

namespace gfs = gitwatch::fs;

namespace gitwatch {

ObjectStore::ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

ObjectStore::~ObjectStore() = default;

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return objects_dir_ / hex.substr(0, 2) / hex.substr(2);
}

void ObjectStore::load_packs() const {
  if (packs_loaded_)
    return;
  packs_loaded_ = true;
  const auto dir = objects_dir_ / consts::kPackDir;
  if (!gfs::is_directory(dir))
    return;
  std::error_code ec;
  std::vector<std::filesystem::path> idx_files;
  for (const auto &e : std::filesystem::directory_iterator(dir, ec)) {
    if (e.path().extension() == ".idx")
      idx_files.push_back(e.path());
  }
  if (ec)
    throw RepositoryError("cannot list " + dir.string() + ": " + ec.message());
  std::ranges::sort(idx_files);
  for (const auto &p : idx_files) {
    packs_.push_back(std::make_unique<PackFile>(p));
    log::debug("pack ", p.filename().string(), ": ", packs_.back()->object_count(), " objects");
  }
}

bool ObjectStore::contains(const oid &id) const {
  if (gfs::exists(path_for_oid(id)))
    return true;
  load_packs();
  return std::ranges::any_of(packs_, [&](const auto &pack) { return pack->find(id).has_value(); });
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw RepositoryError("object_store: bad oid hex '" + std::string(hex_oid) + "'");
  }
  return read(id);
}

Object ObjectStore::read(const oid &id) const {
  const auto loose = path_for_oid(id);
  if (gfs::exists(loose)) {
    std::vector<std::uint8_t> store;
    try {
      store = gfs::z_decompress(gfs::read_file(loose));
    } catch (const std::runtime_error &e) {
      throw RepositoryError("object " + to_hex(id) + ": " + e.what());
    }

    auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
    if (it_space == store.end())
      throw RepositoryError("object_store: invalid header in " + to_hex(id));
    auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
    if (it_nul == store.end())
      throw RepositoryError("object_store: invalid header in " + to_hex(id));
    std::string type(store.begin(), it_space);
    std::size_t payload_off = (it_nul - store.begin()) + 1;
    return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
  }

  load_packs();
  for (const auto &pack : packs_) {
    if (const auto off = pack->find(id))
      return pack->read_at(*off, *this);
  }
  throw RepositoryError("object not found: " + to_hex(id));
}

} // namespace gitwatch
