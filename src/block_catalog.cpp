//
//  block_catalog.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "block_catalog.hpp"

namespace tagforge {

BlockKind classify(uint8_t code) {
    switch (code) {
        case 0:
            return BlockKind::StreamInfo;
        case 1:
            return BlockKind::Padding;
        case 2:
            return BlockKind::Application;
        case 3:
            return BlockKind::SeekTable;
        case 4:
            return BlockKind::VorbisComment;
        case 5:
            return BlockKind::CueSheet;
        case 6:
            return BlockKind::Picture;
        default:
            return BlockKind::Unknown;
    }
}

const char *block_type_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::StreamInfo:
            return "STREAMINFO";
        case BlockKind::Padding:
            return "PADDING";
        case BlockKind::Application:
            return "APPLICATION";
        case BlockKind::SeekTable:
            return "SEEKTABLE";
        case BlockKind::VorbisComment:
            return "VORBIS_COMMENT";
        case BlockKind::CueSheet:
            return "CUESHEET";
        case BlockKind::Picture:
            return "PICTURE";
        case BlockKind::Unknown:
            break;
    }
    return "UNKNOWN";
}

bool is_deletable(BlockKind kind) { return kind != BlockKind::StreamInfo; }

bool must_be_last(BlockKind kind) { return kind == BlockKind::Padding; }

bool is_unique(BlockKind kind) {
    return kind == BlockKind::StreamInfo || kind == BlockKind::SeekTable ||
           kind == BlockKind::VorbisComment;
}

}  // namespace tagforge
