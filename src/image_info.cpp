//
//  image_info.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "image_info.hpp"

namespace tagforge {

namespace {

constexpr uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

uint32_t png_channels(uint8_t color_type) {
    switch (color_type) {
        case 0:
            return 1;  // greyscale
        case 2:
            return 3;  // truecolor
        case 3:
            return 1;  // indexed
        case 4:
            return 2;  // greyscale + alpha
        case 6:
            return 4;  // truecolor + alpha
        default:
            return 0;
    }
}

}  // namespace

// Minimal JPEG dimension parser (SOF0/1/2/3/5/6/7/9/10/11/13/14/15)
bool parse_jpeg_info(const std::vector<uint8_t> &data, ImageInfo &info) {
    if (data.size() < 10 || data[0] != 0xFF || data[1] != 0xD8) {
        return false;  // not a JPEG SOI
    }

    size_t i = 2;
    while (i + 3 < data.size()) {
        if (data[i] != 0xFF) {
            ++i;
            continue;
        }
        uint8_t marker = data[i + 1];
        // Skip padding FFs.
        if (marker == 0xFF) {
            ++i;
            continue;
        }

        // EOI or SOS ends the searchable header section.
        if (marker == 0xD9 || marker == 0xDA) {
            break;
        }

        uint16_t seg_len = (static_cast<uint16_t>(data[i + 2]) << 8) | data[i + 3];
        if (seg_len < 2 || i + 2 + seg_len > data.size()) {
            break;
        }

        bool is_sof = (marker >= 0xC0 && marker <= 0xC3) || (marker >= 0xC5 && marker <= 0xC7) ||
                      (marker >= 0xC9 && marker <= 0xCB) || (marker >= 0xCD && marker <= 0xCF);
        if (is_sof && seg_len >= 8) {
            uint8_t precision = data[i + 4];
            info.height = (static_cast<uint32_t>(data[i + 5]) << 8) | data[i + 6];
            info.width = (static_cast<uint32_t>(data[i + 7]) << 8) | data[i + 8];
            info.depth = static_cast<uint32_t>(precision) * data[i + 9];
            info.mime = "image/jpeg";
            return true;
        }

        i += 2 + seg_len;
    }
    return false;
}

bool parse_png_info(const std::vector<uint8_t> &data, ImageInfo &info) {
    // signature(8) + IHDR length(4) + "IHDR"(4) + width(4) + height(4) + depth(1) + color(1)
    if (data.size() < 26) {
        return false;
    }
    for (size_t i = 0; i < 8; ++i) {
        if (data[i] != kPngSignature[i]) {
            return false;
        }
    }
    if (data[12] != 'I' || data[13] != 'H' || data[14] != 'D' || data[15] != 'R') {
        return false;
    }
    auto be32 = [&](size_t p) {
        return (uint32_t(data[p]) << 24) | (uint32_t(data[p + 1]) << 16) |
               (uint32_t(data[p + 2]) << 8) | uint32_t(data[p + 3]);
    };
    info.width = be32(16);
    info.height = be32(20);
    info.depth = static_cast<uint32_t>(data[24]) * png_channels(data[25]);
    info.mime = "image/png";
    return true;
}

std::optional<ImageInfo> probe_image(const std::vector<uint8_t> &data) {
    ImageInfo info;
    if (parse_jpeg_info(data, info) || parse_png_info(data, info)) {
        return info;
    }
    return std::nullopt;
}

}  // namespace tagforge
