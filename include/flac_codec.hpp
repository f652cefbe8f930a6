//
//  flac_codec.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "codec.hpp"

namespace tagforge {

inline constexpr uint32_t kMaxBlockPayload = 0xFFFFFF;  // 24-bit length field

struct FlacBlockHeader {
    bool is_last = false;
    uint8_t code = 0;
    uint32_t length = 0;
    uint64_t offset = 0;  // offset of the header in the file.
};

/**
 * @brief FLAC codec working on files on disk.
 *
 * Only the metadata section is parsed; audio frames are copied verbatim on save. Saving
 * writes to a temporary file next to the target and renames it over the original.
 */
class FlacCodec : public Codec {
   public:
    Status load(const std::string &path, FlacFile &out) override;
    Status save(FlacFile &file, std::optional<uint32_t> padding = std::nullopt) override;
};

// Serialize the metadata section ("fLaC" + blocks, last flag on the final block).
// Fails with ContainerWrite when a payload exceeds the 24-bit length field.
Status serialize_metadata(const std::vector<MetadataBlock> &blocks, std::vector<uint8_t> &out);

// Replace all PADDING blocks by one trailing block of `size` zero bytes.
void apply_padding_override(std::vector<MetadataBlock> &blocks, uint32_t size);

// Parse the metadata section from a stream positioned anywhere; fills blocks and offsets.
Status parse_metadata(std::istream &in, const std::string &path, FlacFile &out);

}  // namespace tagforge
