//
//  consistency.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "flac_file.hpp"
#include "status.hpp"

namespace tagforge {

enum class ShapeMismatch { None, Count, Codes, FieldNames };

/**
 * @brief Outcome of a shape check across a selection.
 *
 * `status` is a Consistency error when the shapes differ; `mismatch` says which aspect
 * diverged and `status.path` names the first file that differs from the first file.
 */
struct ShapeReport {
    Status status;
    ShapeMismatch mismatch = ShapeMismatch::None;

    bool ok() const { return status.ok; }
};

// Every file must have the same block count and the same ordered block codes.
ShapeReport check_block_shape(const Selection &selection);

// Every file must have the same ordered tag field names.
ShapeReport check_tag_shape(const Selection &selection);

}  // namespace tagforge
