#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace gitwatch {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Incremental SHA-1 over the OpenSSL EVP digest API.
 * Owns its EVP_MD_CTX; not copyable.
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(const Sha1 &) = delete;
  Sha1 &operator=(const Sha1 &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  oid finish();

private:
  void *ctx_;
};

/** SHA-1 of arbitrary bytes. */
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Git object id of a blob with the given content, i.e. SHA-1 over
 *   "blob <size>\\0" + data
 */
oid blob_oid(std::span<const std::uint8_t> data);

/**
 * Git blob id of a file on disk, streamed in chunks so large files are not loaded
 * whole. Throws IoError when the file cannot be read.
 */
oid blob_oid_of_file(const std::filesystem::path &p);

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/** "<type> <size>\\0" */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace gitwatch
