//
//  info_merger.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "info_merger.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <filesystem>

#include "content_hash.hpp"
#include "logging.hpp"
#include "stream_info.hpp"
#include "tag_merger.hpp"

namespace tagforge {

namespace {

std::string format_two_decimals(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::string md5_text(const std::array<uint8_t, 16> &md5) {
    bool unset = true;
    for (uint8_t b : md5) {
        if (b != 0) {
            unset = false;
            break;
        }
    }
    return unset ? std::string() : to_hex(md5.data(), md5.size());
}

bool parse_md5(const std::string &text, std::array<uint8_t, 16> &out) {
    out.fill(0);
    if (text.empty()) {
        return true;
    }
    if (text.size() != 32) {
        return false;
    }
    for (size_t i = 0; i < 16; ++i) {
        unsigned int byte = 0;
        for (size_t k = 0; k < 2; ++k) {
            char c = text[2 * i + k];
            unsigned int v;
            if (c >= '0' && c <= '9') {
                v = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                v = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                v = c - 'A' + 10;
            } else {
                return false;
            }
            byte = (byte << 4) | v;
        }
        out[i] = static_cast<uint8_t>(byte);
    }
    return true;
}

}  // namespace

std::string format_size(uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }
    static const char *kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    return format_two_decimals(size) + " " + kUnits[unit];
}

std::string format_seconds(double seconds) {
    auto total = static_cast<uint64_t>(seconds < 0 ? 0 : seconds);
    // Days wrap the same way a timedelta's seconds component does.
    total %= 86400;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u", static_cast<unsigned>(total / 3600),
                  static_cast<unsigned>((total % 3600) / 60), static_cast<unsigned>(total % 60));
    return buf;
}

InfoFields read_info(const FlacFile &file) {
    InfoFields out;
    std::error_code ec;
    auto len = std::filesystem::file_size(file.path, ec);
    out.emplace_back(kInfoFileLength,
                     ec ? std::string() : std::to_string(len) + " (" + format_size(len) + ")");
    out.emplace_back(kInfoFileHash, file_md5_hex(file.path).value_or(""));

    std::optional<StreamInfo> si;
    if (const MetadataBlock *b = file.find_block(BlockKind::StreamInfo)) {
        si = decode_stream_info(b->payload);
    }
    if (si) {
        out.emplace_back(kInfoMd5, md5_text(si->md5));
        out.emplace_back("bits_per_sample", std::to_string(si->bits_per_sample) + " bit");
        out.emplace_back("sample_rate", format_two_decimals(si->sample_rate / 1000.0) + " kHz");
        out.emplace_back("channels", std::to_string(si->channels));
        out.emplace_back("length", format_seconds(si->length_seconds()));
        double secs = si->length_seconds();
        if (secs > 0 && !ec) {
            // Average over the audio frames only, like most taggers report it.
            uint64_t audio_bytes = len > file.audio_offset ? len - file.audio_offset : 0;
            auto kbps = static_cast<uint64_t>(std::llround(audio_bytes * 8 / secs / 1000.0));
            out.emplace_back("bitrate", std::to_string(kbps) + " kbps");
        } else {
            out.emplace_back("bitrate", "");
        }
        out.emplace_back("min_blocksize", std::to_string(si->min_blocksize));
        out.emplace_back("max_blocksize", std::to_string(si->max_blocksize));
        out.emplace_back("min_framesize", std::to_string(si->min_framesize));
        out.emplace_back("max_framesize", std::to_string(si->max_framesize));
        out.emplace_back("total_samples", std::to_string(si->total_samples));
    } else {
        TF_LOG("warn", "Failed to read STREAMINFO from " << file.path);
    }

    std::string padding;
    if (const MetadataBlock *b = file.find_block(BlockKind::Padding)) {
        padding = std::to_string(b->payload.size());
    }
    out.emplace_back(kInfoPadding, padding);
    out.emplace_back(kInfoVendor, file.vendor);
    return out;
}

InfoFields merge_info(const std::vector<InfoFields> &infos) {
    InfoFields merged;
    if (infos.empty()) {
        return merged;
    }
    for (const auto &kv : infos.front()) {
        std::vector<std::string> values;
        values.reserve(infos.size());
        for (const auto &info : infos) {
            std::string v;
            for (const auto &other : info) {
                if (other.first == kv.first) {
                    v = other.second;
                    break;
                }
            }
            values.push_back(std::move(v));
        }
        merged.emplace_back(kv.first, merge_values(values).display);
    }
    return merged;
}

BatchResult save_info(Selection &selection, const std::string &vendor, const std::string &md5,
                      Codec &codec) {
    BatchResult result;
    if (selection.empty()) {
        result.status = make_error(ErrorKind::Validation, "no files selected");
        return result;
    }
    const bool keep_vendor = is_multivalued_display(vendor);
    const bool keep_md5 = is_multivalued_display(md5);
    std::array<uint8_t, 16> md5_bytes{};
    if (!keep_md5 && !parse_md5(md5, md5_bytes)) {
        result.status = make_error(ErrorKind::Validation,
                                   "MD5 signature must be 32 hexadecimal digits, got '" + md5 + "'");
        return result;
    }

    for (auto &file : selection) {
        FlacFile working = file;
        MetadataBlock *b = working.find_block(BlockKind::StreamInfo);
        std::optional<StreamInfo> si;
        if (b) {
            si = decode_stream_info(b->payload);
        }
        if (!si) {
            result.status = make_error(ErrorKind::ContainerRead, "unreadable STREAMINFO block",
                                       file.path);
            return result;
        }
        if (!keep_md5) {
            si->md5 = md5_bytes;
            b->payload = encode_stream_info(*si);
        }
        if (!keep_vendor) {
            working.vendor = vendor;
        }
        Status st = codec.save(working);
        if (!st.ok) {
            result.status = st;
            return result;
        }
        file = std::move(working);
        result.completed.push_back(file.path);
    }
    TF_LOG("info", "info saved to " << result.completed.size() << " file(s)");
    return result;
}

}  // namespace tagforge
