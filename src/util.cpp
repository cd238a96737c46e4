// Utility helpers for hex and byte-level parsing
#include "gitwatch/util.hpp"

#include "gitwatch/consts.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace gitwatch {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::uint32_t read_be32(std::span<const std::uint8_t> b, std::size_t off) {
  return (static_cast<std::uint32_t>(b[off]) << 24) | (static_cast<std::uint32_t>(b[off + 1]) << 16) |
         (static_cast<std::uint32_t>(b[off + 2]) << 8) | static_cast<std::uint32_t>(b[off + 3]);
}

std::uint16_t read_be16(std::span<const std::uint8_t> b, std::size_t off) {
  return static_cast<std::uint16_t>((b[off] << 8) | b[off + 1]);
}

std::uint64_t read_be64(std::span<const std::uint8_t> b, std::size_t off) {
  return (static_cast<std::uint64_t>(read_be32(b, off)) << 32) | read_be32(b, off + 4);
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto nl = text.find('\n', pos);
    std::string line(text.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                                    : nl - pos));
    rstrip_newlines(line);
    out.push_back(std::move(line));
    if (nl == std::string_view::npos)
      break;
    pos = nl + 1;
  }
  return out;
}

} // namespace strutil

} // namespace gitwatch
