//
//  picture.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagforge {

// ID3v2 APIC picture types used by FLAC; only the front cover is managed here.
inline constexpr uint32_t kPictureTypeFrontCover = 3;

/**
 * @brief Attributes written alongside cover image bytes.
 *
 * Zero width/height/depth mean "unknown", which FLAC allows.
 */
struct PictureAttributes {
    std::string mime = "image/jpeg";
    std::string description;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t depth = 0;
    uint32_t colors = 0;  ///< palette size for indexed images, else 0
};

/**
 * @brief Decoded PICTURE block payload.
 */
struct Picture {
    uint32_t type = kPictureTypeFrontCover;
    PictureAttributes attributes;
    std::vector<uint8_t> data;
};

// Decode a PICTURE block payload; nullopt on truncated or inconsistent lengths.
std::optional<Picture> decode_picture(const std::vector<uint8_t> &payload);

// Encode a PICTURE block payload.
std::vector<uint8_t> encode_picture(const Picture &picture);

}  // namespace tagforge
