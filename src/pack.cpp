#include "gitwatch/pack.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/util.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <zlib.h>

namespace gitwatch {

namespace {

constexpr int kObjCommit = 1;
constexpr int kObjTree = 2;
constexpr int kObjBlob = 3;
constexpr int kObjTag = 4;
constexpr int kObjOfsDelta = 6;
constexpr int kObjRefDelta = 7;

// idx v2 layout: magic, version, 256-entry fanout, then the sorted id table
constexpr std::size_t kIdxHeader = 8;
constexpr std::size_t kFanoutSize = 256 * 4;
constexpr std::size_t kChunk = 16 * 1024;

std::string type_name(int t) {
  switch (t) {
  case kObjCommit:
    return std::string(consts::kTypeCommit);
  case kObjTree:
    return std::string(consts::kTypeTree);
  case kObjBlob:
    return std::string(consts::kTypeBlob);
  case kObjTag:
    return std::string(consts::kTypeTag);
  default:
    throw RepositoryError("pack: unknown object type " + std::to_string(t));
  }
}

// Little-endian base-128 size used at the start of a delta.
std::uint64_t delta_varint(std::span<const std::uint8_t> d, std::size_t &pos) {
  std::uint64_t v = 0;
  int shift = 0;
  for (;;) {
    if (pos >= d.size())
      throw RepositoryError("delta: truncated size");
    if (shift > 63)
      throw RepositoryError("delta: size varint too long");
    const std::uint8_t c = d[pos++];
    v |= static_cast<std::uint64_t>(c & 0x7f) << shift;
    if (!(c & 0x80))
      return v;
    shift += 7;
  }
}

} // namespace

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta) {
  std::size_t pos = 0;
  const auto src_size = delta_varint(delta, pos);
  const auto dst_size = delta_varint(delta, pos);
  if (src_size != base.size())
    throw RepositoryError("delta: base size mismatch");

  std::vector<std::uint8_t> out;
  out.reserve(dst_size);
  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if (op & 0x80) {
      // copy from base: up to 4 offset bytes and 3 size bytes, selected by op bits
      std::uint64_t off = 0;
      std::uint64_t len = 0;
      for (int i = 0; i < 4; ++i) {
        if (op & (1u << i)) {
          if (pos >= delta.size())
            throw RepositoryError("delta: truncated copy");
          off |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      for (int i = 0; i < 3; ++i) {
        if (op & (0x10u << i)) {
          if (pos >= delta.size())
            throw RepositoryError("delta: truncated copy");
          len |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      if (len == 0)
        len = 0x10000;
      if (off + len > base.size())
        throw RepositoryError("delta: copy out of range");
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(off),
                 base.begin() + static_cast<std::ptrdiff_t>(off + len));
    } else if (op != 0) {
      if (pos + op > delta.size())
        throw RepositoryError("delta: truncated insert");
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + op));
      pos += op;
    } else {
      throw RepositoryError("delta: reserved opcode 0");
    }
  }
  if (out.size() != dst_size)
    throw RepositoryError("delta: result size mismatch");
  return out;
}

PackFile::PackFile(const std::filesystem::path &idx_path)
    : pack_path_(std::filesystem::path(idx_path).replace_extension(".pack")),
      idx_(fs::read_file(idx_path)) {
  if (idx_.size() < kIdxHeader + kFanoutSize || read_be32(idx_, 0) != consts::kIdxSignature)
    throw RepositoryError("pack index: bad signature in " + idx_path.string());
  if (read_be32(idx_, 4) != 2)
    throw RepositoryError("pack index: unsupported version in " + idx_path.string());
  count_ = read_be32(idx_, kIdxHeader + 255 * 4);
  // ids (20) + crc (4) + offsets (4) per object, then two trailing checksums
  if (idx_.size() < kIdxHeader + kFanoutSize + std::size_t{count_} * 28 + 40)
    throw RepositoryError("pack index: truncated " + idx_path.string());
  std::uint32_t prev = 0;
  for (std::size_t i = 0; i < 256; ++i) {
    const std::uint32_t n = read_be32(idx_, kIdxHeader + i * 4);
    if (n < prev || n > count_)
      throw RepositoryError("pack index: corrupt fanout table in " + idx_path.string());
    prev = n;
  }

  pack_.open(pack_path_, std::ios::binary);
  if (!pack_)
    throw RepositoryError("pack: cannot open " + pack_path_.string());
  std::array<std::uint8_t, 12> hdr{};
  pack_.read(reinterpret_cast<char *>(hdr.data()), hdr.size());
  if (!pack_ || read_be32(hdr, 0) != consts::kPackSignature)
    throw RepositoryError("pack: bad header in " + pack_path_.string());
  if (read_be32(hdr, 8) != count_)
    throw RepositoryError("pack: object count disagrees with index " + pack_path_.string());
}

std::optional<std::uint64_t> PackFile::find(const oid &id) const {
  const std::size_t fan = kIdxHeader;
  const std::uint32_t lo0 = id[0] == 0 ? 0 : read_be32(idx_, fan + (id[0] - 1) * 4);
  const std::uint32_t hi0 = read_be32(idx_, fan + id[0] * 4);
  const std::size_t ids = fan + kFanoutSize;

  std::uint32_t lo = lo0;
  std::uint32_t hi = hi0;
  while (lo < hi) {
    const std::uint32_t mid = lo + (hi - lo) / 2;
    const int cmp = std::memcmp(idx_.data() + ids + std::size_t{mid} * consts::kOidRawLen,
                                id.data(), consts::kOidRawLen);
    if (cmp == 0) {
      const std::size_t offs = ids + std::size_t{count_} * (consts::kOidRawLen + 4);
      const std::uint32_t off32 = read_be32(idx_, offs + std::size_t{mid} * 4);
      if (!(off32 & 0x80000000u))
        return off32;
      const std::size_t large = offs + std::size_t{count_} * 4;
      const std::size_t at = large + std::size_t{off32 & 0x7fffffffu} * 8;
      if (at + 8 > idx_.size())
        throw RepositoryError("pack index: large offset out of range");
      return read_be64(idx_, at);
    }
    if (cmp < 0)
      lo = mid + 1;
    else
      hi = mid;
  }
  return std::nullopt;
}

PackFile::EntryHeader PackFile::read_header(std::uint64_t offset) const {
  // type+size varint (<= 10 bytes) followed by at most a 20-byte base id
  std::array<std::uint8_t, 32> buf{};
  pack_.clear();
  pack_.seekg(static_cast<std::streamoff>(offset));
  pack_.read(reinterpret_cast<char *>(buf.data()), buf.size());
  const auto got = static_cast<std::size_t>(pack_.gcount());
  if (got == 0)
    throw RepositoryError("pack: entry offset past end of file");

  std::size_t pos = 0;
  auto next = [&]() -> std::uint8_t {
    if (pos >= got)
      throw RepositoryError("pack: truncated entry header");
    return buf[pos++];
  };

  EntryHeader h;
  std::uint8_t c = next();
  h.type = (c >> 4) & 7;
  h.size = c & 15;
  int shift = 4;
  while (c & 0x80) {
    if (shift > 63)
      throw RepositoryError("pack: entry size varint too long");
    c = next();
    h.size |= static_cast<std::uint64_t>(c & 0x7f) << shift;
    shift += 7;
  }

  if (h.type == kObjOfsDelta) {
    c = next();
    std::uint64_t rel = c & 0x7f;
    while (c & 0x80) {
      if (rel > (UINT64_MAX >> 7) - 1)
        throw RepositoryError("pack: delta base offset overflow");
      c = next();
      rel = ((rel + 1) << 7) | (c & 0x7f);
    }
    if (rel == 0 || rel > offset)
      throw RepositoryError("pack: bad delta base offset");
    h.base_offset = offset - rel;
  } else if (h.type == kObjRefDelta) {
    if (pos + consts::kOidRawLen > got)
      throw RepositoryError("pack: truncated delta base id");
    std::memcpy(h.base_id.data(), buf.data() + pos, consts::kOidRawLen);
    pos += consts::kOidRawLen;
  }
  h.data_offset = offset + pos;
  return h;
}

std::vector<std::uint8_t> PackFile::inflate_at(std::uint64_t offset, std::uint64_t size) const {
  pack_.clear();
  pack_.seekg(static_cast<std::streamoff>(offset));

  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw RepositoryError("pack: zlib inflateInit failed");

  std::vector<std::uint8_t> out(size);
  std::array<std::uint8_t, kChunk> in{};
  // zlib rejects a null output pointer, which an empty vector may hand out.
  std::uint8_t empty_sink = 0;
  zs.next_out = out.empty() ? &empty_sink : out.data();
  zs.avail_out = out.empty() ? 1 : static_cast<uInt>(out.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0) {
      pack_.read(reinterpret_cast<char *>(in.data()), in.size());
      const auto got = pack_.gcount();
      if (got <= 0) {
        inflateEnd(&zs);
        throw RepositoryError("pack: entry data truncated");
      }
      zs.next_in = in.data();
      zs.avail_in = static_cast<uInt>(got);
    }
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc == Z_BUF_ERROR) {
      inflateEnd(&zs);
      throw RepositoryError("pack: entry larger than recorded size");
    }
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw RepositoryError("pack: zlib inflate failed");
    }
  }
  const auto total = zs.total_out;
  inflateEnd(&zs);
  if (total != size)
    throw RepositoryError("pack: entry inflated to unexpected size");
  return out;
}

Object PackFile::read_at(std::uint64_t offset, const ObjectStore &store) const {
  // Collect the delta chain down to a full object, then apply back up.
  std::vector<std::vector<std::uint8_t>> deltas;
  Object base;
  std::uint64_t cur = offset;
  for (;;) {
    const auto h = read_header(cur);
    if (h.type == kObjOfsDelta) {
      deltas.push_back(inflate_at(h.data_offset, h.size));
      cur = h.base_offset;
      continue;
    }
    if (h.type == kObjRefDelta) {
      deltas.push_back(inflate_at(h.data_offset, h.size));
      base = store.read(h.base_id);
      break;
    }
    base.type = type_name(h.type);
    base.data = inflate_at(h.data_offset, h.size);
    break;
  }
  for (auto it = deltas.rbegin(); it != deltas.rend(); ++it)
    base.data = apply_delta(base.data, *it);
  return base;
}

} // namespace gitwatch
