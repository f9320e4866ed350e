#include "ContentIdentity.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace {
// 12345678-1234-5678-1234-567812345678
constexpr std::array<unsigned char, 16> kDocumentNamespace = {
    0x12, 0x34, 0x56, 0x78, 0x12, 0x34, 0x56, 0x78,
    0x12, 0x34, 0x56, 0x78, 0x12, 0x34, 0x56, 0x78};

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

EvpContext make_context(const EVP_MD* algorithm) {
  EvpContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx.get(), algorithm, nullptr) != 1) {
    throw std::runtime_error("Failed to initialize digest");
  }
  return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update digest");
  }
}

std::vector<unsigned char> finalize(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize digest");
  }
  return {hash.begin(), hash.begin() + hash_len};
}

std::string to_hex(const unsigned char* data, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result += kDigits[data[i] >> 4];
    result += kDigits[data[i] & 0x0F];
  }
  return result;
}
}  // namespace

std::string ContentIdentity::digest_file(const fs::path& path,
                                         std::size_t chunk_size) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw fs::filesystem_error("Failed to open file for digest", path,
                               std::make_error_code(std::errc::io_error));
  }
  if (chunk_size == 0) chunk_size = kDefaultChunkSize;

  auto ctx = make_context(EVP_sha256());
  std::vector<char> buffer(chunk_size);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto bytes_read = file.gcount();
    if (bytes_read > 0) {
      update(ctx.get(), buffer.data(), static_cast<std::size_t>(bytes_read));
    }
  }
  if (file.bad()) {
    throw fs::filesystem_error("Read error while computing digest", path,
                               std::make_error_code(std::errc::io_error));
  }
  const auto hash = finalize(ctx.get());
  return to_hex(hash.data(), hash.size());
}

std::string ContentIdentity::digest_bytes(std::string_view bytes) {
  auto ctx = make_context(EVP_sha256());
  update(ctx.get(), bytes.data(), bytes.size());
  const auto hash = finalize(ctx.get());
  return to_hex(hash.data(), hash.size());
}

std::string ContentIdentity::normalize_path(const fs::path& path) {
  const auto u8 = path.lexically_normal().generic_u8string();
  return std::string(reinterpret_cast<const char*>(u8.c_str()), u8.length());
}

std::string ContentIdentity::derive_doc_id(const fs::path& path,
                                           std::string_view digest) {
  const std::string name = std::format("{}::{}", normalize_path(path), digest);

  auto ctx = make_context(EVP_sha1());
  update(ctx.get(), kDocumentNamespace.data(), kDocumentNamespace.size());
  update(ctx.get(), name.data(), name.size());
  auto hash = finalize(ctx.get());

  // Version 5 in the high nibble of byte 6, RFC 4122 variant in byte 8.
  hash[6] = static_cast<unsigned char>((hash[6] & 0x0F) | 0x50);
  hash[8] = static_cast<unsigned char>((hash[8] & 0x3F) | 0x80);

  const std::string hex = to_hex(hash.data(), 16);
  return std::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4),
                     hex.substr(12, 4), hex.substr(16, 4), hex.substr(20, 12));
}
