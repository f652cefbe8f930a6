//
//  stream_info.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "stream_info.hpp"

#include "byte_io.hpp"
#include "logging.hpp"

namespace tagforge {

std::optional<StreamInfo> decode_stream_info(const std::vector<uint8_t> &payload) {
    if (payload.size() < kStreamInfoSize) {
        TF_LOG("warn", "streaminfo: short payload (" << payload.size() << " bytes)");
        return std::nullopt;
    }
    ByteReader r(payload);
    StreamInfo si;
    si.min_blocksize = r.u16();
    si.max_blocksize = r.u16();
    si.min_framesize = r.u24();
    si.max_framesize = r.u24();
    // 20 bits sample rate | 3 bits channels-1 | 5 bits bps-1 | 36 bits total samples
    uint64_t packed = r.u64();
    si.sample_rate = static_cast<uint32_t>(packed >> 44);
    si.channels = static_cast<uint8_t>(((packed >> 41) & 0x07) + 1);
    si.bits_per_sample = static_cast<uint8_t>(((packed >> 36) & 0x1F) + 1);
    si.total_samples = packed & 0xFFFFFFFFFULL;
    auto md5 = r.bytes(16);
    for (size_t i = 0; i < md5.size() && i < si.md5.size(); ++i) {
        si.md5[i] = md5[i];
    }
    return si;
}

std::vector<uint8_t> encode_stream_info(const StreamInfo &info) {
    std::vector<uint8_t> out;
    out.reserve(kStreamInfoSize);
    write_u16(out, info.min_blocksize);
    write_u16(out, info.max_blocksize);
    write_u24(out, info.min_framesize & 0xFFFFFF);
    write_u24(out, info.max_framesize & 0xFFFFFF);
    uint64_t channels = info.channels ? info.channels - 1 : 0;
    uint64_t bps = info.bits_per_sample ? info.bits_per_sample - 1 : 0;
    uint64_t packed = (static_cast<uint64_t>(info.sample_rate & 0xFFFFF) << 44) |
                      ((channels & 0x07) << 41) | ((bps & 0x1F) << 36) |
                      (info.total_samples & 0xFFFFFFFFFULL);
    write_u32(out, static_cast<uint32_t>(packed >> 32));
    write_u32(out, static_cast<uint32_t>(packed & 0xFFFFFFFF));
    out.insert(out.end(), info.md5.begin(), info.md5.end());
    return out;
}

}  // namespace tagforge
