//
//  flac_file.hpp
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

#include "block_catalog.hpp"
#include "tag_dict.hpp"

namespace tagforge {

/**
 * @brief One metadata block: raw type code plus opaque payload.
 *
 * The payload is kept exactly as read so untouched blocks are written back byte-for-byte.
 * Content identity is derived from the payload on demand (see content_hash.hpp).
 */
struct MetadataBlock {
    uint8_t code = 0;
    std::vector<uint8_t> payload;

    MetadataBlock() = default;
    MetadataBlock(uint8_t c, std::vector<uint8_t> p) : code(c), payload(std::move(p)) {}
    MetadataBlock(BlockKind k, std::vector<uint8_t> p)
        : code(block_code(k)), payload(std::move(p)) {}

    BlockKind kind() const { return classify(code); }

    bool operator==(const MetadataBlock &o) const {
        return code == o.code && payload == o.payload;
    }
    bool operator!=(const MetadataBlock &o) const { return !(*this == o); }
};

/**
 * @brief In-memory view of one FLAC file.
 *
 * `tags` and `vendor` are decoded from the VORBIS_COMMENT block on load and are the
 * authoritative copy; the codec re-encodes them into that block on save.
 */
struct FlacFile {
    std::string path;
    std::vector<MetadataBlock> blocks;
    TagDict tags;
    std::string vendor;

    // Codec bookkeeping: where the "fLaC" marker and the first audio frame sit on disk.
    // Bytes before the marker (an ID3v2 prefix) are preserved on save.
    uint64_t marker_offset = 0;
    uint64_t audio_offset = 0;

    std::vector<uint8_t> block_codes() const;

    // First block of `kind`, or nullptr.
    const MetadataBlock *find_block(BlockKind kind) const;
    MetadataBlock *find_block(BlockKind kind);

    size_t count_blocks(BlockKind kind) const;
};

// Ordered set of files chosen for one batch operation; rebuilt on every selection change.
using Selection = std::vector<FlacFile>;

}  // namespace tagforge
