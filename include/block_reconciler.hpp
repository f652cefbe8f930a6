//
//  block_reconciler.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "codec.hpp"
#include "content_hash.hpp"
#include "flac_file.hpp"
#include "status.hpp"

namespace tagforge {

/// Identity of one block as displayed: type code plus content hash.
struct BlockRef {
    uint8_t code = 0;
    ContentHash hash{};

    bool operator==(const BlockRef &o) const { return code == o.code && hash == o.hash; }
};

/// Desired block arrangement, shared by every file of the selection.
using BlockOrder = std::vector<BlockRef>;

/// One row of the block list shown to the user.
struct BlockRow {
    size_t index = 0;
    uint8_t code = 0;
    std::string type_name;
    std::string hash_hex;
    std::string summary;  ///< short human readable description of the payload
    BlockRef ref;
};

struct BlockViewResult {
    Status status;
    std::vector<BlockRow> rows;
    BlockOrder order;
};

// Short description of a block payload for display (e.g. "4096 bytes", "image/jpeg 600x600").
std::string summarize_block(const MetadataBlock &block);

// Current arrangement of one file.
BlockOrder block_order_of(const FlacFile &file);

// Run the block-shape check and describe the first file's blocks.
BlockViewResult block_view(const Selection &selection);

// Reorder entries: `permutation[i]` is the old index of the entry placed at position i.
Status reorder_blocks(BlockOrder &order, const std::vector<size_t> &permutation);

// Remove one entry; STREAMINFO entries are rejected without touching `order`.
Status delete_block_at(BlockOrder &order, size_t index);

// Exactly one STREAMINFO entry must remain.
Status validate_block_order(const BlockOrder &order);

/**
 * @brief Rebuild one file's block list from `order`.
 *
 * Each entry consumes the first not yet used block of the file with the same code and the
 * same freshly computed content hash. An entry without match yields UnresolvedBlock and
 * leaves `file` untouched.
 */
Status reconcile(FlacFile &file, const BlockOrder &order);

// Advisories for a finished arrangement (padding not last, STREAMINFO not first).
std::vector<std::string> block_order_advisories(const std::vector<uint8_t> &codes);

/**
 * @brief Apply `order` to every file of the selection and persist each one.
 *
 * The order is validated and the block shape re-checked before any file is touched. Files
 * are reconciled and saved in turn; the first failure stops the loop, leaving earlier files
 * written (listed in `completed`). Written files are re-read to report padding advisories.
 */
BatchResult apply_block_order(Selection &selection, const BlockOrder &order, Codec &codec);

}  // namespace tagforge
