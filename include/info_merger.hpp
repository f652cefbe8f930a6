//
//  info_merger.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "flac_file.hpp"
#include "status.hpp"

namespace tagforge {

/// Display fields of the technical info view, in display order.
using InfoFields = std::vector<std::pair<std::string, std::string>>;

// Field keys used in InfoFields.
inline constexpr const char *kInfoFileLength = "file_length";
inline constexpr const char *kInfoFileHash = "file_hash";
inline constexpr const char *kInfoMd5 = "md5";
inline constexpr const char *kInfoVendor = "vendor_string";
inline constexpr const char *kInfoPadding = "padding_length";

// "0 B", "512.00 B", "1.50 KB", ... (1024 based, two decimals).
std::string format_size(uint64_t bytes);

// "HH:MM:SS".
std::string format_seconds(double seconds);

/**
 * @brief Technical info for one file.
 *
 * Stream parameters come from STREAMINFO; the whole-file MD5 and length are read from disk
 * and left empty when the file is not readable.
 */
InfoFields read_info(const FlacFile &file);

// Merge per-file info field by field (identical values collapse, else multivalued marker).
InfoFields merge_info(const std::vector<InfoFields> &infos);

/**
 * @brief Update vendor string and audio MD5 signature on every file.
 *
 * Values that still show the multivalued marker keep each file's own value. `md5` must be
 * 32 hex digits or empty (the all-zero "unset" signature); it is validated before any I/O.
 */
BatchResult save_info(Selection &selection, const std::string &vendor, const std::string &md5,
                      Codec &codec);

}  // namespace tagforge
