//
//  tag_merger.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_merger.hpp"

#include <algorithm>
#include <set>

#include "consistency.hpp"
#include "logging.hpp"

namespace tagforge {

namespace {

// Vorbis comment field names: printable ASCII 0x20..0x7D without '='.
bool valid_field_name(const std::string &name) {
    if (name.empty()) {
        return false;
    }
    for (unsigned char c : name) {
        if (c < 0x20 || c > 0x7D || c == '=') {
            return false;
        }
    }
    return true;
}

Status validate_rows(const std::vector<MergedTagRow> &rows) {
    for (size_t i = 0; i < rows.size(); ++i) {
        if (!valid_field_name(rows[i].field_name)) {
            return make_error(ErrorKind::Validation,
                              "invalid field name '" + rows[i].field_name + "' in row " +
                                  std::to_string(i + 1));
        }
        for (size_t j = 0; j < i; ++j) {
            if (iequals(rows[i].field_name, rows[j].field_name)) {
                return make_error(ErrorKind::Validation,
                                  "field '" + rows[i].field_name + "' appears more than once");
            }
        }
    }
    return ok_status();
}

TagDict resolve_tags(const std::vector<MergedTagRow> &rows, const FlacFile &current) {
    TagDict out;
    for (const auto &row : rows) {
        if (!is_multivalued_display(row.display_value)) {
            out.set(row.field_name, row.display_value);
            continue;
        }
        // Untouched divergent field: keep what this file held.
        std::vector<std::string> original;
        auto it = row.per_file_original.find(current.path);
        if (it != row.per_file_original.end()) {
            original = it->second;
        } else {
            original = current.tags.get(row.field_name);
        }
        if (!original.empty()) {
            out.set(row.field_name, std::move(original));
        }
    }
    return out;
}

}  // namespace

MergedValue merge_values(const std::vector<std::string> &values) {
    MergedValue out;
    if (values.empty()) {
        return out;
    }
    const bool same = std::all_of(values.begin(), values.end(),
                                  [&](const std::string &v) { return v == values.front(); });
    if (same) {
        out.display = values.front();
        return out;
    }
    std::set<std::string> distinct(values.begin(), values.end());
    out.multivalued = true;
    out.distinct.assign(distinct.begin(), distinct.end());
    out.display = std::string(kMultivaluedMarker) + " ";
    for (size_t i = 0; i < out.distinct.size(); ++i) {
        if (i) {
            out.display += kMultivaluedSeparator;
        }
        out.display += out.distinct[i];
    }
    return out;
}

bool is_multivalued_display(const std::string &value) {
    const std::string prefix = std::string(kMultivaluedMarker) + " ";
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::vector<MergedTagRow> merge_tags(const Selection &selection,
                                     const std::vector<std::string> &field_names) {
    std::vector<MergedTagRow> rows;
    rows.reserve(field_names.size());
    for (const auto &name : field_names) {
        MergedTagRow row;
        row.field_name = name;
        std::vector<std::string> firsts;
        firsts.reserve(selection.size());
        for (const auto &f : selection) {
            auto values = f.tags.get(name);
            firsts.push_back(values.empty() ? std::string() : values.front());
            row.per_file_original[f.path] = std::move(values);
        }
        MergedValue merged = merge_values(firsts);
        row.display_value = std::move(merged.display);
        row.multivalued = merged.multivalued;
        row.distinct_values = std::move(merged.distinct);
        TF_LOG("merge", name << " -> '" << row.display_value << "'"
                             << (row.multivalued ? " (multivalued)" : ""));
        rows.push_back(std::move(row));
    }
    return rows;
}

TagMergeResult merge_tags(const Selection &selection) {
    TagMergeResult result;
    if (selection.empty()) {
        return result;
    }
    ShapeReport shape = check_tag_shape(selection);
    if (!shape.ok()) {
        result.status = shape.status;
        return result;
    }
    result.rows = merge_tags(selection, selection.front().tags.names());
    return result;
}

Status parse_padding_override(const std::string &text, uint32_t &out) {
    if (text.empty() || text.size() > 8 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return make_error(ErrorKind::Validation,
                          "Padding value must be a non-empty number, got '" + text + "'");
    }
    unsigned long v = std::stoul(text);
    if (v > 0xFFFFFF) {
        return make_error(ErrorKind::Validation,
                          "Padding value " + text + " exceeds the 16 MiB block limit");
    }
    out = static_cast<uint32_t>(v);
    return ok_status();
}

BatchResult save_tags(Selection &selection, const std::vector<MergedTagRow> &rows, Codec &codec,
                      std::optional<uint32_t> padding) {
    BatchResult result;
    if (selection.empty()) {
        result.status = make_error(ErrorKind::Validation, "no files selected");
        return result;
    }
    if (padding && *padding > 0xFFFFFF) {
        result.status = make_error(ErrorKind::Validation, "padding exceeds the 16 MiB block limit");
        return result;
    }
    result.status = validate_rows(rows);
    if (!result.status.ok) {
        return result;
    }

    // Snapshot every file before touching any of them.
    Selection fresh(selection.size());
    for (size_t i = 0; i < selection.size(); ++i) {
        Status st = codec.load(selection[i].path, fresh[i]);
        if (!st.ok) {
            TF_LOG("error", "failed to read tags from " << selection[i].path << ": "
                                                        << st.message);
            result.status = st;
            return result;
        }
        for (const auto &row : rows) {
            TF_LOG("debug", "snapshot " << fresh[i].path << " " << row.field_name << "="
                                        << fresh[i].tags.first(row.field_name, "<absent>"));
        }
    }

    for (size_t i = 0; i < fresh.size(); ++i) {
        FlacFile &file = fresh[i];
        file.tags = resolve_tags(rows, file);
        Status st = codec.save(file, padding);
        if (!st.ok) {
            TF_LOG("error", "failed to save tags to " << file.path << ": " << st.message
                                                      << "; " << result.completed.size()
                                                      << " file(s) already updated");
            result.status = st;
            return result;
        }
        result.completed.push_back(file.path);
        selection[i] = file;
    }
    TF_LOG("info", "tags saved to " << result.completed.size() << " file(s)");
    return result;
}

#ifdef TAGFORGE_TESTING
namespace testing {
TagDict resolve_tags_for_test(const std::vector<MergedTagRow> &rows, const FlacFile &current) {
    return resolve_tags(rows, current);
}
}  // namespace testing
#endif

}  // namespace tagforge
