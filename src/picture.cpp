//
//  picture.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "picture.hpp"

#include "byte_io.hpp"
#include "logging.hpp"

namespace tagforge {

std::optional<Picture> decode_picture(const std::vector<uint8_t> &payload) {
    ByteReader r(payload);
    Picture pic;
    pic.type = r.u32();
    uint32_t mime_len = r.u32();
    pic.attributes.mime = r.str(mime_len);
    uint32_t desc_len = r.u32();
    pic.attributes.description = r.str(desc_len);
    pic.attributes.width = r.u32();
    pic.attributes.height = r.u32();
    pic.attributes.depth = r.u32();
    pic.attributes.colors = r.u32();
    uint32_t data_len = r.u32();
    pic.data = r.bytes(data_len);
    if (r.failed()) {
        TF_LOG("warn", "picture: truncated payload (" << payload.size() << " bytes)");
        return std::nullopt;
    }
    return pic;
}

std::vector<uint8_t> encode_picture(const Picture &picture) {
    const auto &a = picture.attributes;
    std::vector<uint8_t> out;
    out.reserve(32 + a.mime.size() + a.description.size() + picture.data.size());
    write_u32(out, picture.type);
    write_u32(out, static_cast<uint32_t>(a.mime.size()));
    write_bytes(out, a.mime);
    write_u32(out, static_cast<uint32_t>(a.description.size()));
    write_bytes(out, a.description);
    write_u32(out, a.width);
    write_u32(out, a.height);
    write_u32(out, a.depth);
    write_u32(out, a.colors);
    write_u32(out, static_cast<uint32_t>(picture.data.size()));
    write_bytes(out, picture.data);
    return out;
}

}  // namespace tagforge
