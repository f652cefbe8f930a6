//
//  vorbis_comment.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "vorbis_comment.hpp"

#include "byte_io.hpp"
#include "logging.hpp"

namespace tagforge {

bool decode_vorbis_comment(const std::vector<uint8_t> &payload, std::string &vendor,
                           TagDict &tags) {
    ByteReader r(payload);
    uint32_t vendor_len = r.u32_le();
    vendor = r.str(vendor_len);
    uint32_t count = r.u32_le();
    if (r.failed()) {
        TF_LOG("warn", "vorbis comment: truncated header");
        return false;
    }
    tags.clear();
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t len = r.u32_le();
        std::string entry = r.str(len);
        if (r.failed()) {
            TF_LOG("warn", "vorbis comment: truncated entry " << i << " of " << count);
            return false;
        }
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            TF_LOG("debug", "vorbis comment: skipping malformed entry '" << entry << "'");
            continue;
        }
        tags.add(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return true;
}

std::vector<uint8_t> encode_vorbis_comment(const std::string &vendor, const TagDict &tags) {
    std::vector<uint8_t> out;
    write_u32_le(out, static_cast<uint32_t>(vendor.size()));
    write_bytes(out, vendor);
    uint32_t count = 0;
    for (const auto &f : tags.fields()) {
        count += static_cast<uint32_t>(f.values.size());
    }
    write_u32_le(out, count);
    for (const auto &f : tags.fields()) {
        for (const auto &v : f.values) {
            std::string entry = f.name + "=" + v;
            write_u32_le(out, static_cast<uint32_t>(entry.size()));
            write_bytes(out, entry);
        }
    }
    return out;
}

bool sync_tags_to_block(FlacFile &file) {
    MetadataBlock *vc = file.find_block(BlockKind::VorbisComment);
    if (!vc) {
        if (file.tags.empty() && file.vendor.empty()) {
            return false;
        }
        if (file.vendor.empty()) {
            file.vendor = kDefaultVendor;
        }
        size_t pos = 0;
        for (size_t i = 0; i < file.blocks.size(); ++i) {
            if (file.blocks[i].kind() == BlockKind::StreamInfo) {
                pos = i + 1;
                break;
            }
        }
        file.blocks.insert(file.blocks.begin() + static_cast<std::ptrdiff_t>(pos),
                           MetadataBlock(BlockKind::VorbisComment,
                                         encode_vorbis_comment(file.vendor, file.tags)));
        TF_LOG("codec", "added VORBIS_COMMENT block at index " << pos << " for " << file.path);
        return true;
    }
    // Keep the stored bytes when they already decode to the same content, so blocks that
    // were only moved are written back unchanged.
    std::string stored_vendor;
    TagDict stored_tags;
    if (decode_vorbis_comment(vc->payload, stored_vendor, stored_tags) &&
        stored_vendor == file.vendor && stored_tags == file.tags) {
        return false;
    }
    auto payload = encode_vorbis_comment(file.vendor, file.tags);
    vc->payload = std::move(payload);
    return true;
}

}  // namespace tagforge
