//
//  block_reconciler.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "block_reconciler.hpp"

#include <sstream>

#include "block_catalog.hpp"
#include "byte_io.hpp"
#include "consistency.hpp"
#include "logging.hpp"
#include "picture.hpp"
#include "stream_info.hpp"
#include "vorbis_comment.hpp"

namespace tagforge {

namespace {

constexpr size_t kSeekPointSize = 18;

std::string describe_ref(const BlockRef &ref) {
    std::ostringstream oss;
    oss << block_type_name(classify(ref.code)) << " (code " << static_cast<int>(ref.code)
        << ", hash " << to_hex(ref.hash) << ")";
    return oss.str();
}

// Tags follow the VORBIS_COMMENT block that survived reconciliation.
void refresh_tags_from_blocks(FlacFile &file) {
    const MetadataBlock *vc = file.find_block(BlockKind::VorbisComment);
    if (!vc) {
        file.tags.clear();
        file.vendor.clear();
        return;
    }
    std::string vendor;
    TagDict tags;
    if (decode_vorbis_comment(vc->payload, vendor, tags)) {
        file.vendor = std::move(vendor);
        file.tags = std::move(tags);
    }
}

}  // namespace

std::string summarize_block(const MetadataBlock &block) {
    std::ostringstream oss;
    const size_t size = block.payload.size();
    switch (block.kind()) {
        case BlockKind::StreamInfo: {
            auto si = decode_stream_info(block.payload);
            if (!si) {
                oss << "malformed, " << size << " bytes";
                break;
            }
            oss << si->sample_rate << " Hz, " << static_cast<int>(si->channels) << " ch, "
                << static_cast<int>(si->bits_per_sample) << " bit, " << si->total_samples
                << " samples";
            break;
        }
        case BlockKind::Padding:
            oss << size << " bytes";
            break;
        case BlockKind::Application: {
            ByteReader r(block.payload);
            std::string id = r.str(4);
            oss << "id '" << id << "', " << size << " bytes";
            break;
        }
        case BlockKind::SeekTable:
            oss << size / kSeekPointSize << " seek points";
            break;
        case BlockKind::VorbisComment: {
            std::string vendor;
            TagDict tags;
            if (!decode_vorbis_comment(block.payload, vendor, tags)) {
                oss << "malformed, " << size << " bytes";
                break;
            }
            oss << "vendor '" << vendor << "', " << tags.size() << " fields";
            break;
        }
        case BlockKind::Picture: {
            auto pic = decode_picture(block.payload);
            if (!pic) {
                oss << "malformed, " << size << " bytes";
                break;
            }
            oss << "type " << pic->type << ", " << pic->attributes.mime << " "
                << pic->attributes.width << "x" << pic->attributes.height << ", "
                << pic->data.size() << " bytes";
            break;
        }
        case BlockKind::CueSheet:
        case BlockKind::Unknown:
            oss << size << " bytes";
            break;
    }
    return oss.str();
}

BlockOrder block_order_of(const FlacFile &file) {
    BlockOrder order;
    order.reserve(file.blocks.size());
    for (const auto &b : file.blocks) {
        order.push_back(BlockRef{b.code, content_hash(b)});
    }
    return order;
}

BlockViewResult block_view(const Selection &selection) {
    BlockViewResult result;
    if (selection.empty()) {
        return result;
    }
    ShapeReport shape = check_block_shape(selection);
    if (!shape.ok()) {
        result.status = shape.status;
        return result;
    }
    const FlacFile &first = selection.front();
    result.order = block_order_of(first);
    for (size_t i = 0; i < first.blocks.size(); ++i) {
        const auto &b = first.blocks[i];
        BlockRow row;
        row.index = i;
        row.code = b.code;
        row.type_name = block_type_name(b.kind());
        row.ref = result.order[i];
        row.hash_hex = to_hex(row.ref.hash);
        row.summary = summarize_block(b);
        result.rows.push_back(std::move(row));
    }
    return result;
}

Status reorder_blocks(BlockOrder &order, const std::vector<size_t> &permutation) {
    if (permutation.size() != order.size()) {
        return make_error(ErrorKind::Validation,
                          "new order lists " + std::to_string(permutation.size()) +
                              " blocks, expected " + std::to_string(order.size()));
    }
    std::vector<bool> seen(order.size(), false);
    for (size_t idx : permutation) {
        if (idx >= order.size() || seen[idx]) {
            return make_error(ErrorKind::Validation,
                              "new order is not a permutation (index " + std::to_string(idx) +
                                  ")");
        }
        seen[idx] = true;
    }
    BlockOrder reordered;
    reordered.reserve(order.size());
    for (size_t idx : permutation) {
        reordered.push_back(order[idx]);
    }
    order = std::move(reordered);
    return ok_status();
}

Status delete_block_at(BlockOrder &order, size_t index) {
    if (index >= order.size()) {
        return make_error(ErrorKind::Validation,
                          "block index " + std::to_string(index) + " out of range");
    }
    const BlockKind kind = classify(order[index].code);
    if (!is_deletable(kind)) {
        return make_error(ErrorKind::Validation,
                          std::string(block_type_name(kind)) + " block cannot be deleted.");
    }
    TF_LOG("debug", "removing " << describe_ref(order[index]) << " at " << index);
    order.erase(order.begin() + static_cast<std::ptrdiff_t>(index));
    return ok_status();
}

Status validate_block_order(const BlockOrder &order) {
    size_t stream_infos = 0;
    for (const auto &ref : order) {
        if (classify(ref.code) == BlockKind::StreamInfo) {
            ++stream_infos;
        }
    }
    if (stream_infos != 1) {
        return make_error(ErrorKind::Validation,
                          "block order must contain exactly one STREAMINFO block, found " +
                              std::to_string(stream_infos));
    }
    return ok_status();
}

Status reconcile(FlacFile &file, const BlockOrder &order) {
    const std::vector<MetadataBlock> backup = file.blocks;
    std::vector<bool> used(backup.size(), false);
    std::vector<MetadataBlock> rebuilt;
    rebuilt.reserve(order.size());

    for (size_t n = 0; n < order.size(); ++n) {
        const BlockRef &want = order[n];
        bool found = false;
        for (size_t i = 0; i < backup.size(); ++i) {
            if (used[i] || backup[i].code != want.code) {
                continue;
            }
            if (content_hash(backup[i]) == want.hash) {
                used[i] = true;
                rebuilt.push_back(backup[i]);
                found = true;
                break;
            }
        }
        if (!found) {
            TF_LOG("error", "unresolved block " << describe_ref(want) << " at position " << n
                                                << " in " << file.path);
            return make_error(ErrorKind::UnresolvedBlock,
                              "no block matches " + describe_ref(want) + " at position " +
                                  std::to_string(n),
                              file.path);
        }
    }
    TF_LOG("reconcile", file.path << ": " << backup.size() << " -> " << rebuilt.size()
                                  << " blocks");
    file.blocks = std::move(rebuilt);
    refresh_tags_from_blocks(file);
    return ok_status();
}

std::vector<std::string> block_order_advisories(const std::vector<uint8_t> &codes) {
    std::vector<std::string> out;
    if (codes.empty()) {
        return out;
    }
    for (size_t i = 0; i + 1 < codes.size(); ++i) {
        if (must_be_last(classify(codes[i]))) {
            out.emplace_back(
                "Modification completed, changes to PADDING may not take effect, PADDING must "
                "be at the last position.");
            break;
        }
    }
    if (classify(codes.front()) != BlockKind::StreamInfo) {
        out.emplace_back("STREAMINFO is not the first block; most decoders will reject the file.");
    }
    return out;
}

BatchResult apply_block_order(Selection &selection, const BlockOrder &order, Codec &codec) {
    BatchResult result;
    if (selection.empty()) {
        result.status = make_error(ErrorKind::Validation, "no files selected");
        return result;
    }
    result.status = validate_block_order(order);
    if (!result.status.ok) {
        return result;
    }
    ShapeReport shape = check_block_shape(selection);
    if (!shape.ok()) {
        result.status = shape.status;
        return result;
    }

    for (auto &file : selection) {
        FlacFile working = file;
        Status st = reconcile(working, order);
        if (st.ok) {
            st = codec.save(working);
        }
        if (!st.ok) {
            TF_LOG("error", "block update stopped at " << file.path << ": " << st.message << "; "
                                                       << result.completed.size()
                                                       << " file(s) already updated");
            result.status = st;
            return result;
        }
        file = std::move(working);
        result.completed.push_back(file.path);
    }

    // Re-read what was written; the padding rule is about the stored layout.
    for (const auto &path : result.completed) {
        FlacFile reread;
        Status st = codec.load(path, reread);
        if (!st.ok) {
            result.advisories.push_back("could not re-read " + path + ": " + st.message);
            continue;
        }
        for (auto &msg : block_order_advisories(reread.block_codes())) {
            TF_LOG("warn", path << ": " << msg);
            result.advisories.push_back(path + ": " + msg);
        }
    }
    TF_LOG("info", "block order applied to " << result.completed.size() << " file(s)");
    return result;
}

}  // namespace tagforge
