//
//  image_info.hpp
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

struct ImageInfo {
    std::string mime;    // "image/jpeg" or "image/png"
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t depth = 0;  // bits per pixel
};

// Minimal header inspection for cover art; nullopt when the data is neither JPEG nor PNG
// or the header is truncated.
std::optional<ImageInfo> probe_image(const std::vector<uint8_t> &data);

// JPEG: dimensions and depth (precision * components) from the first SOF segment.
bool parse_jpeg_info(const std::vector<uint8_t> &data, ImageInfo &info);

// PNG: dimensions and depth from IHDR.
bool parse_png_info(const std::vector<uint8_t> &data, ImageInfo &info);

}  // namespace tagforge
