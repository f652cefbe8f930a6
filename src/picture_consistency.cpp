//
//  picture_consistency.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "picture_consistency.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "image_info.hpp"
#include "logging.hpp"

namespace tagforge {

namespace {

bool is_front_cover_block(const MetadataBlock &block) {
    if (block.kind() != BlockKind::Picture) {
        return false;
    }
    auto pic = decode_picture(block.payload);
    return pic && pic->type == kPictureTypeFrontCover;
}

}  // namespace

std::optional<Picture> front_cover(const FlacFile &file) {
    for (const auto &b : file.blocks) {
        if (b.kind() != BlockKind::Picture) {
            continue;
        }
        auto pic = decode_picture(b.payload);
        if (pic && pic->type == kPictureTypeFrontCover) {
            return pic;
        }
    }
    return std::nullopt;
}

bool check_picture_consistency(const Selection &selection) {
    if (selection.size() < 2) {
        return true;
    }
    const auto first = front_cover(selection.front());
    for (size_t i = 1; i < selection.size(); ++i) {
        const auto other = front_cover(selection[i]);
        if (first.has_value() != other.has_value()) {
            TF_LOG("debug", "cover present in only some files (" << selection[i].path << ")");
            return false;
        }
        if (first && first->data != other->data) {
            TF_LOG("debug", "cover differs: " << selection[i].path << " first bytes "
                                              << hex_prefix(other->data));
            return false;
        }
    }
    return true;
}

std::optional<PictureAttributes> picture_attributes_from_image(const std::vector<uint8_t> &data) {
    auto info = probe_image(data);
    if (!info) {
        return std::nullopt;
    }
    PictureAttributes attrs;
    attrs.mime = info->mime;
    attrs.width = info->width;
    attrs.height = info->height;
    attrs.depth = info->depth;
    return attrs;
}

void set_front_cover(FlacFile &file, const std::vector<uint8_t> &data,
                     const PictureAttributes &attributes) {
    std::vector<MetadataBlock> kept;
    kept.reserve(file.blocks.size() + 1);
    for (auto &b : file.blocks) {
        if (!is_front_cover_block(b)) {
            kept.push_back(std::move(b));
        }
    }
    Picture pic;
    pic.type = kPictureTypeFrontCover;
    pic.attributes = attributes;
    pic.data = data;
    MetadataBlock block(BlockKind::Picture, encode_picture(pic));

    auto pos = kept.end();
    if (!kept.empty() && kept.back().kind() == BlockKind::Padding) {
        pos = kept.end() - 1;
    }
    kept.insert(pos, std::move(block));
    file.blocks = std::move(kept);
}

BatchResult apply_picture(Selection &selection, const std::vector<uint8_t> &data,
                          const PictureAttributes &attributes, Codec &codec) {
    BatchResult result;
    if (selection.empty()) {
        result.status = make_error(ErrorKind::Validation, "no files selected");
        return result;
    }
    if (data.empty()) {
        result.status = make_error(ErrorKind::Validation, "no cover image data");
        return result;
    }
    TF_LOG("debug", "apply_picture bytes=" << data.size() << " mime=" << attributes.mime << " "
                                           << attributes.width << "x" << attributes.height
                                           << " head=" << hex_prefix(data));
    for (auto &file : selection) {
        FlacFile working = file;
        set_front_cover(working, data, attributes);
        Status st = codec.save(working);
        if (!st.ok) {
            TF_LOG("error", "cover update stopped at " << file.path << ": " << st.message << "; "
                                                       << result.completed.size()
                                                       << " file(s) already updated");
            result.status = st;
            return result;
        }
        file = std::move(working);
        result.completed.push_back(file.path);
    }
    TF_LOG("info", "cover set on " << result.completed.size() << " file(s)");
    return result;
}

Status export_cover(const FlacFile &file, const std::string &path) {
    auto pic = front_cover(file);
    if (!pic || pic->data.empty()) {
        return make_error(ErrorKind::Validation, "No cover image to save.", file.path);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return make_error(ErrorKind::ContainerWrite,
                          "open failed: " + std::generic_category().message(errno), path);
    }
    out.write(reinterpret_cast<const char *>(pic->data.data()),
              static_cast<std::streamsize>(pic->data.size()));
    if (!out.good()) {
        return make_error(ErrorKind::ContainerWrite, "write failed", path);
    }
    return ok_status();
}

}  // namespace tagforge
