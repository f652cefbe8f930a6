//
//  tag_merger.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "codec.hpp"
#include "flac_file.hpp"
#include "status.hpp"

namespace tagforge {

// Display prefix for values that differ across the selection ("≪Multivalued≫ A; B").
inline constexpr const char *kMultivaluedMarker = "\xE2\x89\xAA" "Multivalued" "\xE2\x89\xAB";
inline constexpr const char *kMultivaluedSeparator = "; ";

struct MergedValue {
    std::string display;
    bool multivalued = false;
    std::vector<std::string> distinct;  ///< sorted, only filled when multivalued
};

// Identical values collapse to one; otherwise marker + sorted distinct values.
MergedValue merge_values(const std::vector<std::string> &values);

// True when `value` still starts with the multivalued marker.
bool is_multivalued_display(const std::string &value);

/**
 * @brief One row of the merged tag table.
 *
 * `per_file_original` maps each file path to the values it held at merge time; an empty
 * list means the field was absent in that file. Rows added by the user have no entries.
 */
struct MergedTagRow {
    std::string field_name;
    std::string display_value;
    bool multivalued = false;
    std::vector<std::string> distinct_values;
    std::map<std::string, std::vector<std::string>> per_file_original;
};

struct TagMergeResult {
    Status status;
    std::vector<MergedTagRow> rows;
};

// Merge `field_names` across the selection, first value per file, absent fields as "".
std::vector<MergedTagRow> merge_tags(const Selection &selection,
                                     const std::vector<std::string> &field_names);

// Run the tag-shape check, then merge the first file's field names.
TagMergeResult merge_tags(const Selection &selection);

// Parse a padding override typed by the user: decimal digits only, at most 2^24 - 1.
Status parse_padding_override(const std::string &text, uint32_t &out);

/**
 * @brief Write the edited tag table to every file of the selection.
 *
 * Every file is re-loaded first to snapshot its current values; a failing load aborts
 * before anything is written. Each file then gets its tags cleared and rebuilt from `rows`
 * in order: rows that still show the multivalued marker restore that file's own values,
 * other rows are written as a single value. The loop stops at the first failed save.
 * On success `selection` holds the written files.
 */
BatchResult save_tags(Selection &selection, const std::vector<MergedTagRow> &rows, Codec &codec,
                      std::optional<uint32_t> padding = std::nullopt);

#ifdef TAGFORGE_TESTING
namespace testing {
// Build the tag dictionary save_tags() would write for one file.
TagDict resolve_tags_for_test(const std::vector<MergedTagRow> &rows, const FlacFile &current);
}  // namespace testing
#endif

}  // namespace tagforge
