#include "gitwatch/index.hpp"

#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/util.hpp"

#include <algorithm>
#include <cstring>

namespace gitwatch {

namespace {

// Fixed part of an entry: ctime, mtime, dev, ino, mode, uid, gid, size, id, flags.
constexpr std::size_t kEntryFixed = 62;
constexpr std::size_t kHeaderSize = 12;

// Offset-style varint used by index v4 for the number of bytes to strip.
std::uint64_t read_varint(std::span<const std::uint8_t> b, std::size_t &pos) {
  if (pos >= b.size())
    throw RepositoryError("index: truncated path prefix");
  std::uint8_t c = b[pos++];
  std::uint64_t v = c & 0x7f;
  while (c & 0x80) {
    if (pos >= b.size())
      throw RepositoryError("index: truncated path prefix");
    c = b[pos++];
    v = ((v + 1) << 7) | (c & 0x7f);
  }
  return v;
}

} // namespace

Index::Index(std::filesystem::path index_file) : index_file_(std::move(index_file)) {}

void Index::load() {
  entries_.clear();
  version_ = 0;
  if (!fs::exists(index_file_))
    return;
  parse(fs::read_file(index_file_));
}

void Index::parse(std::span<const std::uint8_t> b) {
  entries_.clear();
  if (b.size() < kHeaderSize || read_be32(b, 0) != consts::kIndexSignature)
    throw RepositoryError("index: bad signature");
  version_ = read_be32(b, 4);
  if (version_ < 2 || version_ > 4)
    throw RepositoryError("index: unsupported version " + std::to_string(version_));
  const std::uint32_t count = read_be32(b, 8);
  // trailing SHA-1 checksum of everything before it
  const std::size_t limit = b.size() >= consts::kOidRawLen ? b.size() - consts::kOidRawLen : 0;

  entries_.reserve(count);
  std::size_t off = kHeaderSize;
  std::string prev_path;
  for (std::uint32_t i = 0; i < count; ++i) {
    if (off + kEntryFixed > limit)
      throw RepositoryError("index: truncated entry " + std::to_string(i));
    const std::size_t start = off;

    IndexEntry e;
    e.mtime_s = read_be32(b, off + 8);
    e.mtime_ns = read_be32(b, off + 12);
    e.mode = read_be32(b, off + 24);
    e.size = read_be32(b, off + 36);
    std::memcpy(e.id.data(), b.data() + off + 40, consts::kOidRawLen);
    const std::uint16_t flags = read_be16(b, off + 60);
    e.stage = static_cast<std::uint16_t>((flags & consts::kIndexStageMask) >>
                                         consts::kIndexStageShift);
    off += kEntryFixed;

    if ((flags & consts::kIndexFlagExtended) && version_ >= 3) {
      if (off + 2 > limit)
        throw RepositoryError("index: truncated extended flags");
      const std::uint16_t ext = read_be16(b, off);
      e.skip_worktree = (ext & consts::kIndexExtSkipWorktree) != 0;
      e.intent_to_add = (ext & consts::kIndexExtIntentToAdd) != 0;
      off += 2;
    }

    if (version_ == 4) {
      const auto strip = read_varint(b, off);
      if (strip > prev_path.size())
        throw RepositoryError("index: bad path prefix length");
      const auto nul = std::find(b.begin() + static_cast<std::ptrdiff_t>(off),
                                 b.begin() + static_cast<std::ptrdiff_t>(limit), 0);
      if (nul == b.begin() + static_cast<std::ptrdiff_t>(limit))
        throw RepositoryError("index: unterminated path");
      e.path = prev_path.substr(0, prev_path.size() - strip);
      e.path.append(b.begin() + static_cast<std::ptrdiff_t>(off), nul);
      off = static_cast<std::size_t>(nul - b.begin()) + 1;
    } else {
      std::size_t len = flags & consts::kIndexNameMask;
      if (len == consts::kIndexNameMask) {
        // long name: length stored as "too long", read up to the NUL
        const auto nul = std::find(b.begin() + static_cast<std::ptrdiff_t>(off),
                                   b.begin() + static_cast<std::ptrdiff_t>(limit), 0);
        len = static_cast<std::size_t>(nul - b.begin()) - off;
      }
      if (off + len > limit)
        throw RepositoryError("index: truncated path");
      e.path.assign(reinterpret_cast<const char *>(b.data() + off), len);
      // entries are NUL-padded to a multiple of eight bytes
      const std::size_t used = off + len - start;
      off = start + ((used + 8) & ~std::size_t{7});
    }

    prev_path = e.path;
    entries_.push_back(std::move(e));
  }
}

std::map<std::string, const IndexEntry *> Index::by_path() const {
  std::map<std::string, const IndexEntry *> m;
  for (const auto &e : entries_) {
    if (e.stage == 0)
      m[e.path] = &e;
  }
  return m;
}

} // namespace gitwatch
