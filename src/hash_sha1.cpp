#include "gitwatch/hash.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"

#include <cstdint>
#include <fstream>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

namespace {
EVP_MD_CTX *as_ctx(void *p) { return static_cast<EVP_MD_CTX *>(p); }
} // namespace

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(as_ctx(ctx_));
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
}

Sha1::~Sha1() { EVP_MD_CTX_free(as_ctx(ctx_)); }

void Sha1::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(as_ctx(ctx_), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

oid Sha1::finish() {
  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(as_ctx(ctx_), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

oid sha1(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(data);
  return h.finish();
}

oid blob_oid(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(object_header(consts::kTypeBlob, data.size()));
  h.update(data);
  return h.finish();
}

oid blob_oid_of_file(const std::filesystem::path &p) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) {
    throw IoError("stat failed: " + p.string() + ": " + ec.message());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }

  Sha1 h;
  h.update(object_header(consts::kTypeBlob, static_cast<std::size_t>(size)));
  std::vector<std::uint8_t> buf(64 * 1024);
  std::uintmax_t total = 0;
  while (ifs) {
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(ifs.gcount());
    if (n == 0)
      break;
    h.update(std::span<const std::uint8_t>(buf.data(), n));
    total += n;
  }
  // File changed size while hashing; the header no longer matches the content.
  if (total != size) {
    throw IoError("file changed while hashing: " + p.string());
  }
  return h.finish();
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kOidHexLen);
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitwatch
