#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Big-endian readers for on-disk git formats. Callers check bounds.
auto read_be32(std::span<const std::uint8_t> bytes, std::size_t off) -> std::uint32_t;
auto read_be16(std::span<const std::uint8_t> bytes, std::size_t off) -> std::uint16_t;
auto read_be64(std::span<const std::uint8_t> bytes, std::size_t off) -> std::uint64_t;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading and trailing spaces/tabs/CR
  std::string trim(std::string_view sv);

  std::vector<std::string> split_lines(std::string_view text);
}

} // namespace gitwatch
