//
//  content_hash.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "flac_file.hpp"

namespace tagforge {

inline constexpr size_t kContentHashSize = 32;  // SHA-256

using ContentHash = std::array<uint8_t, kContentHashSize>;

// SHA-256 over the block payload as stored. The type code is not part of the digest;
// identity comparisons pair the hash with the code.
ContentHash content_hash(const MetadataBlock &block);

ContentHash sha256(const std::vector<uint8_t> &data);

// MD5 of a whole file on disk; nullopt when it cannot be read.
std::optional<std::string> file_md5_hex(const std::string &path);

// Lowercase hex rendering, 64 characters for a ContentHash.
std::string to_hex(const ContentHash &hash);
std::string to_hex(const uint8_t *data, size_t len);

// Parse a 64-character hex digest (case-insensitive).
std::optional<ContentHash> content_hash_from_hex(const std::string &hex);

}  // namespace tagforge
