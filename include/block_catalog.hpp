//
//  block_catalog.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

namespace tagforge {

// FLAC metadata block type codes as stored in the 7-bit header field.
enum class BlockKind : uint8_t {
    StreamInfo = 0,
    Padding = 1,
    Application = 2,
    SeekTable = 3,
    VorbisComment = 4,
    CueSheet = 5,
    Picture = 6,
    Unknown = 0x7F,
};

inline constexpr uint8_t block_code(BlockKind kind) { return static_cast<uint8_t>(kind); }

// Map a raw block code to its kind; reserved and invalid codes are Unknown.
BlockKind classify(uint8_t code);

// Display name as shown in the block list (e.g. "VORBIS_COMMENT").
const char *block_type_name(BlockKind kind);

// Every kind except STREAMINFO may be removed from a file.
bool is_deletable(BlockKind kind);

// PADDING is expected to be the final block; advisory only.
bool must_be_last(BlockKind kind);

// At most one block of this kind per file (STREAMINFO, SEEKTABLE, VORBIS_COMMENT).
bool is_unique(BlockKind kind);

}  // namespace tagforge
