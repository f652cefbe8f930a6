//
//  tagforge.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "tagforge.hpp"
#include "tagforge_version.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "logging.hpp"
#include "picture_consistency.hpp"

namespace tagforge {

std::string version_string() { return TAGFORGE_VERSION_DISPLAY; }

namespace {

void merge_into(BatchResult &into, const BatchResult &from) {
    for (const auto &p : from.completed) {
        if (std::find(into.completed.begin(), into.completed.end(), p) == into.completed.end()) {
            into.completed.push_back(p);
        }
    }
    into.advisories.insert(into.advisories.end(), from.advisories.begin(), from.advisories.end());
    if (!from.status.ok) {
        into.status = from.status;
    }
}

}  // namespace

Status Editor::select_files(const std::vector<std::string> &paths) {
    const auto t0 = std::chrono::steady_clock::now();
    selection_.clear();
    pending_cover_.reset();
    tags_dirty_ = false;
    blocks_dirty_ = false;

    Selection loaded(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        Status st = codec_.load(paths[i], loaded[i]);
        if (!st.ok) {
            TF_LOG("error", "select_files: " << describe(st));
            rebuild_tag_view();
            rebuild_block_view();
            return st;
        }
    }
    selection_ = std::move(loaded);
    rebuild_tag_view();
    rebuild_block_view();
    const auto t1 = std::chrono::steady_clock::now();
    TF_LOG("debug", "selected " << selection_.size() << " file(s) in "
                                << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                                       .count()
                                << " ms; tags " << (tags_.status.ok ? "ok" : "inconsistent")
                                << ", blocks " << (blocks_.status.ok ? "ok" : "inconsistent"));
    return ok_status();
}

std::vector<std::string> Editor::paths() const {
    std::vector<std::string> out;
    out.reserve(selection_.size());
    for (const auto &f : selection_) {
        out.push_back(f.path);
    }
    return out;
}

void Editor::rebuild_tag_view() {
    tags_ = merge_tags(selection_);
    tags_dirty_ = false;
}

void Editor::rebuild_block_view() {
    blocks_ = tagforge::block_view(selection_);
    order_ = blocks_.order;
    blocks_dirty_ = false;
}

Status Editor::tags_editable() const {
    if (selection_.empty()) {
        return make_error(ErrorKind::Validation, "Please select a FLAC file first.");
    }
    return tags_.status;
}

Status Editor::blocks_editable() const {
    if (selection_.empty()) {
        return make_error(ErrorKind::Validation, "Please select a FLAC file first.");
    }
    return blocks_.status;
}

MergedTagRow *Editor::find_row(const std::string &field_name) {
    for (auto &row : tags_.rows) {
        if (iequals(row.field_name, field_name)) {
            return &row;
        }
    }
    return nullptr;
}

Status Editor::edit_tag_row(const std::string &field_name, const std::string &value) {
    Status st = tags_editable();
    if (!st.ok) {
        return st;
    }
    MergedTagRow *row = find_row(field_name);
    if (!row) {
        return make_error(ErrorKind::Validation, "no tag row named '" + field_name + "'");
    }
    row->display_value = value;
    tags_dirty_ = true;
    return ok_status();
}

Status Editor::add_tag_row(const std::string &field_name, const std::string &value) {
    Status st = tags_editable();
    if (!st.ok) {
        return st;
    }
    if (field_name.empty()) {
        return make_error(ErrorKind::Validation, "field name must not be empty");
    }
    if (find_row(field_name)) {
        return make_error(ErrorKind::Validation, "tag row '" + field_name + "' already exists");
    }
    MergedTagRow row;
    row.field_name = field_name;
    row.display_value = value;
    tags_.rows.push_back(std::move(row));
    tags_dirty_ = true;
    return ok_status();
}

Status Editor::remove_tag_row(const std::string &field_name) {
    Status st = tags_editable();
    if (!st.ok) {
        return st;
    }
    auto it = std::find_if(tags_.rows.begin(), tags_.rows.end(), [&](const MergedTagRow &r) {
        return iequals(r.field_name, field_name);
    });
    if (it == tags_.rows.end()) {
        return make_error(ErrorKind::Validation, "no tag row named '" + field_name + "'");
    }
    tags_.rows.erase(it);
    tags_dirty_ = true;
    return ok_status();
}

BatchResult Editor::save_tags(const std::string &padding_text) {
    BatchResult result;
    result.status = tags_editable();
    if (!result.status.ok) {
        return result;
    }
    std::optional<uint32_t> padding;
    if (!padding_text.empty()) {
        uint32_t value = 0;
        result.status = parse_padding_override(padding_text, value);
        if (!result.status.ok) {
            return result;
        }
        padding = value;
    }
    result = tagforge::save_tags(selection_, tags_.rows, codec_, padding);
    if (result.ok()) {
        tags_dirty_ = false;
    }
    reload_after_save(result);
    return result;
}

Status Editor::reorder_blocks(const std::vector<size_t> &permutation) {
    Status st = blocks_editable();
    if (!st.ok) {
        return st;
    }
    st = tagforge::reorder_blocks(order_, permutation);
    if (st.ok) {
        blocks_dirty_ = true;
    }
    return st;
}

Status Editor::delete_block_at(size_t index) {
    Status st = blocks_editable();
    if (!st.ok) {
        return st;
    }
    st = tagforge::delete_block_at(order_, index);
    if (st.ok) {
        blocks_dirty_ = true;
    }
    return st;
}

BatchResult Editor::save_blocks() {
    BatchResult result;
    result.status = blocks_editable();
    if (!result.status.ok) {
        return result;
    }
    result = apply_block_order(selection_, order_, codec_);
    if (result.ok()) {
        blocks_dirty_ = false;
    }
    reload_after_save(result);
    return result;
}

bool Editor::cover_consistent() const { return check_picture_consistency(selection_); }

std::optional<Picture> Editor::cover() const {
    if (selection_.empty() || !cover_consistent()) {
        return std::nullopt;
    }
    return front_cover(selection_.front());
}

Status Editor::set_cover_image(const std::vector<uint8_t> &data,
                               std::optional<PictureAttributes> attributes) {
    if (selection_.empty()) {
        return make_error(ErrorKind::Validation, "Please select a FLAC file first.");
    }
    if (data.empty()) {
        return make_error(ErrorKind::Validation, "cover image is empty");
    }
    if (!attributes) {
        attributes = picture_attributes_from_image(data);
        if (!attributes) {
            return make_error(ErrorKind::Validation,
                              "unsupported image format; pass mime type and dimensions");
        }
    }
    pending_cover_ = PendingCover{data, *attributes};
    return ok_status();
}

BatchResult Editor::save_cover() {
    BatchResult result;
    if (!pending_cover_) {
        result.status = make_error(ErrorKind::Validation, "no cover image staged");
        return result;
    }
    result = apply_picture(selection_, pending_cover_->data, pending_cover_->attributes, codec_);
    if (result.ok()) {
        pending_cover_.reset();
    }
    reload_after_save(result);
    return result;
}

InfoFields Editor::info() const {
    std::vector<InfoFields> infos;
    infos.reserve(selection_.size());
    for (const auto &f : selection_) {
        infos.push_back(read_info(f));
    }
    return merge_info(infos);
}

BatchResult Editor::save_info(const std::string &vendor, const std::string &md5) {
    BatchResult result = tagforge::save_info(selection_, vendor, md5, codec_);
    reload_after_save(result);
    return result;
}

BatchResult Editor::save(const std::string &padding_text) {
    BatchResult combined;
    if (blocks_dirty_) {
        merge_into(combined, save_blocks());
        if (!combined.ok()) {
            return combined;
        }
    }
    if (tags_dirty_ || !padding_text.empty()) {
        merge_into(combined, save_tags(padding_text));
        if (!combined.ok()) {
            return combined;
        }
    }
    if (pending_cover_) {
        merge_into(combined, save_cover());
    }
    return combined;
}

// Re-read every file so views reflect what is on disk. Views with unsaved edits are kept.
void Editor::reload_after_save(BatchResult &result) {
    if (!result.ok() && !result.completed.empty()) {
        result.advisories.push_back("some files may have been updated already");
    }
    Selection reloaded(selection_.size());
    for (size_t i = 0; i < selection_.size(); ++i) {
        Status st = codec_.load(selection_[i].path, reloaded[i]);
        if (!st.ok) {
            TF_LOG("warn", "reload after save failed: " << describe(st));
            result.advisories.push_back("could not re-read " + selection_[i].path + ": " +
                                        st.message);
            return;
        }
    }
    selection_ = std::move(reloaded);
    if (!tags_dirty_) {
        rebuild_tag_view();
    }
    if (!blocks_dirty_) {
        rebuild_block_view();
    }
}

}  // namespace tagforge
