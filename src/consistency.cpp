//
//  consistency.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "consistency.hpp"

#include "logging.hpp"

namespace tagforge {

namespace {

ShapeReport mismatch(ShapeMismatch what, std::string msg, const std::string &path) {
    TF_LOG("warn", msg << " (" << path << ")");
    ShapeReport r;
    r.status = make_error(ErrorKind::Consistency, std::move(msg), path);
    r.mismatch = what;
    return r;
}

}  // namespace

ShapeReport check_block_shape(const Selection &selection) {
    if (selection.size() < 2) {
        return ShapeReport{};
    }
    const auto &ref = selection.front();
    const auto ref_codes = ref.block_codes();
    for (size_t i = 1; i < selection.size(); ++i) {
        const auto &f = selection[i];
        if (f.blocks.size() != ref.blocks.size()) {
            return mismatch(ShapeMismatch::Count,
                            "Metadata blocks count is not consistent among FLAC files (" +
                                std::to_string(ref.blocks.size()) + " vs " +
                                std::to_string(f.blocks.size()) + ")",
                            f.path);
        }
        if (f.block_codes() != ref_codes) {
            return mismatch(ShapeMismatch::Codes,
                            "Metadata block codes combination is not consistent among FLAC files",
                            f.path);
        }
    }
    TF_LOG("debug", "block shape consistent across " << selection.size() << " files");
    return ShapeReport{};
}

ShapeReport check_tag_shape(const Selection &selection) {
    if (selection.size() < 2) {
        return ShapeReport{};
    }
    const auto ref_names = selection.front().tags.names();
    for (size_t i = 1; i < selection.size(); ++i) {
        if (selection[i].tags.names() != ref_names) {
            return mismatch(ShapeMismatch::FieldNames,
                            "Selected files have different tag fields or orders; batch tag "
                            "editing is not supported for this selection",
                            selection[i].path);
        }
    }
    TF_LOG("debug", "tag shape consistent across " << selection.size() << " files");
    return ShapeReport{};
}

}  // namespace tagforge
