//
//  stream_info.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace tagforge {

inline constexpr size_t kStreamInfoSize = 34;

// Decoded STREAMINFO block (34 bytes, bit-packed, big-endian).
struct StreamInfo {
    uint16_t min_blocksize = 0;
    uint16_t max_blocksize = 0;
    uint32_t min_framesize = 0;  // 24 bit
    uint32_t max_framesize = 0;  // 24 bit
    uint32_t sample_rate = 0;    // 20 bit
    uint8_t channels = 0;        // 1..8
    uint8_t bits_per_sample = 0; // 4..32
    uint64_t total_samples = 0;  // 36 bit
    std::array<uint8_t, 16> md5{};

    double length_seconds() const {
        return sample_rate ? static_cast<double>(total_samples) / sample_rate : 0.0;
    }
};

std::optional<StreamInfo> decode_stream_info(const std::vector<uint8_t> &payload);

std::vector<uint8_t> encode_stream_info(const StreamInfo &info);

}  // namespace tagforge
