//
//  tagforge.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "block_reconciler.hpp"
#include "codec.hpp"
#include "flac_file.hpp"
#include "info_merger.hpp"
#include "picture.hpp"
#include "status.hpp"
#include "tag_merger.hpp"

namespace tagforge {

/// @defgroup api TagForge Public API
/// Batch editing of FLAC metadata blocks and tags.
/// @{

/**
 * @brief Return the TagForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief One editing session over a selection of FLAC files.
 *
 * Selecting files loads them through the codec and eagerly builds the merged tag table and
 * the block list, so shape mismatches are reported before any edit. Edits stay in memory
 * until one of the save calls. The session keeps no global state; create one per window
 * (or per CLI invocation).
 */
class Editor {
   public:
    explicit Editor(Codec &codec) : codec_(codec) {}

    /// Load `paths` in order. Any load failure clears the selection.
    Status select_files(const std::vector<std::string> &paths);  ///< @ingroup api

    const Selection &selection() const { return selection_; }
    std::vector<std::string> paths() const;

    // -- Tags -------------------------------------------------------------------------------

    /// Merged tag table; `status` holds the tag-shape error for incompatible selections.
    const TagMergeResult &tag_view() const { return tags_; }

    /// Replace the value shown for `field_name`.
    Status edit_tag_row(const std::string &field_name, const std::string &value);

    /// Append a new row (field must not exist yet).
    Status add_tag_row(const std::string &field_name, const std::string &value);

    /// Drop a row; the field is removed from every file on save.
    Status remove_tag_row(const std::string &field_name);

    /// Write the tag table to every file. `padding_text` empty means keep padding as is.
    BatchResult save_tags(const std::string &padding_text = {});  ///< @ingroup api

    // -- Blocks -----------------------------------------------------------------------------

    /// Block list of the first file; `status` holds the block-shape error if any.
    const BlockViewResult &block_view() const { return blocks_; }
    const BlockOrder &block_order() const { return order_; }

    /// `permutation[i]` is the current index of the block to place at position i.
    Status reorder_blocks(const std::vector<size_t> &permutation);
    Status delete_block_at(size_t index);

    /// Apply the pending block order to every file.
    BatchResult save_blocks();  ///< @ingroup api

    // -- Cover ------------------------------------------------------------------------------

    /// True when every file shows the same front cover (or none has one).
    bool cover_consistent() const;

    /// The shared front cover, nullopt when absent or when files differ.
    std::optional<Picture> cover() const;

    /// Stage a new cover for all files. Missing attributes are probed from the image.
    Status set_cover_image(const std::vector<uint8_t> &data,
                           std::optional<PictureAttributes> attributes = std::nullopt);

    BatchResult save_cover();  ///< @ingroup api

    // -- Info -------------------------------------------------------------------------------

    InfoFields info() const;
    BatchResult save_info(const std::string &vendor, const std::string &md5);

    // -- All pending edits ------------------------------------------------------------------

    /// Commit pending edits: block order first, then tags, then cover.
    BatchResult save(const std::string &padding_text = {});  ///< @ingroup api

    bool tags_dirty() const { return tags_dirty_; }
    bool blocks_dirty() const { return blocks_dirty_; }
    bool cover_pending() const { return pending_cover_.has_value(); }

   private:
    struct PendingCover {
        std::vector<uint8_t> data;
        PictureAttributes attributes;
    };

    MergedTagRow *find_row(const std::string &field_name);
    Status tags_editable() const;
    Status blocks_editable() const;
    void rebuild_tag_view();
    void rebuild_block_view();
    void reload_after_save(BatchResult &result);

    Codec &codec_;
    Selection selection_;
    TagMergeResult tags_;
    BlockViewResult blocks_;
    BlockOrder order_;
    std::optional<PendingCover> pending_cover_;
    bool tags_dirty_ = false;
    bool blocks_dirty_ = false;
};

/// @}

}  // namespace tagforge
