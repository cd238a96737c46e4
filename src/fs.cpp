#include "gitwatch/fs.hpp"

#include "gitwatch/errors.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace gitwatch::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (static_cast<std::size_t>(ifs.gcount()) != n)
    throw IoError("short read: " + p.string());
  return buf;
}

std::optional<std::string> read_text(const std::filesystem::path &p) {
  if (!fs::exists(p))
    return std::nullopt;
  const auto bytes = read_file(p);
  return std::string(bytes.begin(), bytes.end());
}

namespace {

// Runs inflate until the stream ends; bytes after the end of the stream are ignored.
std::vector<std::uint8_t> inflate_stream(std::span<const std::uint8_t> data, std::size_t hint) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  std::vector<std::uint8_t> out(std::max<std::size_t>(hint, 64));
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.total_out == out.size())
      out.resize(out.size() * 2);
    zs.next_out = reinterpret_cast<Bytef *>(out.data() + zs.total_out);
    zs.avail_out = static_cast<uInt>(out.size() - zs.total_out);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib stream truncated");
    }
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib inflate failed");
    }
  }
  out.resize(zs.total_out);
  inflateEnd(&zs);
  return out;
}

} // namespace

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  return inflate_stream(data, data.size() * 3);
}

bool is_within(const std::filesystem::path &p, const std::filesystem::path &base) {
  const auto np = p.lexically_normal();
  const auto nb = base.lexically_normal();
  auto it_p = np.begin();
  for (auto it_b = nb.begin(); it_b != nb.end(); ++it_b, ++it_p) {
    // A trailing separator on base shows up as an empty final element.
    if (it_b->empty() && std::next(it_b) == nb.end())
      return true;
    if (it_p == np.end() || *it_p != *it_b)
      return false;
  }
  return true;
}

} // namespace gitwatch::fs
