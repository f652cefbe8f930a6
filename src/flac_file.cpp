//
//  flac_file.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "flac_file.hpp"

namespace tagforge {

std::vector<uint8_t> FlacFile::block_codes() const {
    std::vector<uint8_t> codes;
    codes.reserve(blocks.size());
    for (const auto &b : blocks) {
        codes.push_back(b.code);
    }
    return codes;
}

const MetadataBlock *FlacFile::find_block(BlockKind kind) const {
    for (const auto &b : blocks) {
        if (b.kind() == kind) {
            return &b;
        }
    }
    return nullptr;
}

MetadataBlock *FlacFile::find_block(BlockKind kind) {
    for (auto &b : blocks) {
        if (b.kind() == kind) {
            return &b;
        }
    }
    return nullptr;
}

size_t FlacFile::count_blocks(BlockKind kind) const {
    size_t n = 0;
    for (const auto &b : blocks) {
        if (b.kind() == kind) {
            ++n;
        }
    }
    return n;
}

}  // namespace tagforge
