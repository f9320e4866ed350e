#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace ContentIdentity {
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;

// Streams the file through SHA-256 in chunk_size pieces and returns the
// lowercase hex digest. Throws fs::filesystem_error if the file can't be read.
std::string digest_file(const fs::path& path,
                        std::size_t chunk_size = kDefaultChunkSize);

// SHA-256 of an in-memory buffer, hex encoded.
std::string digest_bytes(std::string_view bytes);

// Lexically normalised, '/'-separated UTF-8 form of a path.
std::string normalize_path(const fs::path& path);

// Name-based (RFC 4122 version 5) UUID over "<normalized path>::<digest>".
std::string derive_doc_id(const fs::path& path, std::string_view digest);
}  // namespace ContentIdentity
