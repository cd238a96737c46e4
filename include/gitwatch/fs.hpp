#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gitwatch::fs {

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Whole file as text; std::nullopt when it does not exist.
std::optional<std::string> read_text(const std::filesystem::path& p);

// Inflate a complete zlib stream (loose objects).
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// True when `p` equals `base` or lies beneath it (lexical check on normalized paths).
bool is_within(const std::filesystem::path& p, const std::filesystem::path& base);

} // namespace gitwatch::fs
