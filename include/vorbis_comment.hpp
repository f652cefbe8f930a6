//
//  vorbis_comment.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "flac_file.hpp"
#include "tag_dict.hpp"

namespace tagforge {

inline constexpr const char *kDefaultVendor = "TagForge";

// Decode a VORBIS_COMMENT payload. Returns false on truncated data; comments without
// '=' are skipped. Repeated names are grouped into one field at the first position.
bool decode_vorbis_comment(const std::vector<uint8_t> &payload, std::string &vendor,
                           TagDict &tags);

// Encode vendor + tags; every value becomes its own NAME=value entry.
std::vector<uint8_t> encode_vorbis_comment(const std::string &vendor, const TagDict &tags);

// Write `file.tags`/`file.vendor` into the VORBIS_COMMENT block. A missing block is created
// right after STREAMINFO when there are tags or a vendor to store; an existing block is never
// removed.
// Returns true when a block payload changed.
bool sync_tags_to_block(FlacFile &file);

}  // namespace tagforge
