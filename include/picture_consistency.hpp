//
//  picture_consistency.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codec.hpp"
#include "flac_file.hpp"
#include "picture.hpp"
#include "status.hpp"

namespace tagforge {

// First PICTURE block of front-cover type, decoded; nullopt when there is none.
std::optional<Picture> front_cover(const FlacFile &file);

/**
 * @brief Compare the first front cover of every file by image bytes.
 *
 * False when any two covers differ or when only some files have a cover. A selection in
 * which no file has a cover is consistent.
 */
bool check_picture_consistency(const Selection &selection);

// Derive mime/width/height/depth from the image header; `description` stays empty.
std::optional<PictureAttributes> picture_attributes_from_image(const std::vector<uint8_t> &data);

// Replace the front cover of one file in memory (no I/O).
void set_front_cover(FlacFile &file, const std::vector<uint8_t> &data,
                     const PictureAttributes &attributes);

/**
 * @brief Set the same front cover on every file and persist each one.
 *
 * Existing front-cover blocks are removed and one new block is inserted before a trailing
 * PADDING block (or appended). Best effort across files: the first failed save stops the
 * loop and earlier files stay modified.
 */
BatchResult apply_picture(Selection &selection, const std::vector<uint8_t> &data,
                          const PictureAttributes &attributes, Codec &codec);

// Write the front cover image bytes of `file` to `path`.
Status export_cover(const FlacFile &file, const std::string &path);

}  // namespace tagforge
