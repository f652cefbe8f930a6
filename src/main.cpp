//
//  main.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "flac_codec.hpp"
#include "logging.hpp"
#include "picture_consistency.hpp"
#include "tagforge.hpp"
#include "tagforge_version.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool read_bytes(const std::filesystem::path &p, std::vector<uint8_t> &out) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) return false;
    f.seekg(0, std::ios::end);
    std::streamoff len = f.tellg();
    if (len < 0) return false;
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), len);
    return f.gcount() == len;
}

json status_json(const tagforge::Status &st) {
    json j;
    j["ok"] = st.ok;
    if (!st.ok) {
        j["error"] = tagforge::error_kind_name(st.kind);
        j["message"] = st.message;
        if (!st.path.empty()) {
            j["path"] = st.path;
        }
    }
    return j;
}

json batch_json(const tagforge::BatchResult &res) {
    json j = status_json(res.status);
    j["completed"] = res.completed;
    j["advisories"] = res.advisories;
    return j;
}

json tags_json(const tagforge::Editor &editor) {
    const auto &view = editor.tag_view();
    json j = status_json(view.status);
    json rows = json::array();
    for (const auto &row : view.rows) {
        json r;
        r["field"] = row.field_name;
        r["value"] = row.display_value;
        r["multivalued"] = row.multivalued;
        if (row.multivalued) {
            r["values"] = row.distinct_values;
        }
        rows.push_back(r);
    }
    j["rows"] = rows;
    return j;
}

json blocks_json(const tagforge::Editor &editor) {
    const auto &view = editor.block_view();
    json j = status_json(view.status);
    json rows = json::array();
    for (const auto &row : view.rows) {
        json r;
        r["index"] = row.index;
        r["code"] = row.code;
        r["type"] = row.type_name;
        r["hash"] = row.hash_hex;
        r["summary"] = row.summary;
        rows.push_back(r);
    }
    j["rows"] = rows;
    return j;
}

json info_json(const tagforge::Editor &editor) {
    json j = json::object();
    for (const auto &kv : editor.info()) {
        j[kv.first] = kv.second;
    }
    return j;
}

json cover_json(const tagforge::Editor &editor, const std::filesystem::path &export_path) {
    json j;
    if (!editor.cover_consistent()) {
        j["state"] = "Multiple images";
        return j;
    }
    auto pic = editor.cover();
    if (!pic) {
        j["state"] = "No cover";
        return j;
    }
    j["state"] = "cover";
    j["mime"] = pic->attributes.mime;
    j["width"] = pic->attributes.width;
    j["height"] = pic->attributes.height;
    j["depth"] = pic->attributes.depth;
    j["description"] = pic->attributes.description;
    j["bytes"] = pic->data.size();
    if (!export_path.empty()) {
        auto st = tagforge::export_cover(editor.selection().front(), export_path.string());
        if (st.ok) {
            j["exported"] = export_path.string();
        } else {
            TF_LOG("error", "cover export failed: " << tagforge::describe(st));
        }
    }
    return j;
}

tagforge::Status validation(const std::string &msg) {
    return tagforge::make_error(tagforge::ErrorKind::Validation, msg);
}

// Stage everything the plan asks for on the editor; nothing is written here.
tagforge::Status stage_plan(const json &plan, const std::filesystem::path &plan_dir,
                            tagforge::Editor &editor, std::string &padding_text) {
    if (plan.contains("block_order")) {
        auto perm = plan.at("block_order").get<std::vector<size_t>>();
        auto st = editor.reorder_blocks(perm);
        if (!st.ok) return st;
    }
    if (plan.contains("delete_blocks")) {
        auto indices = plan.at("delete_blocks").get<std::vector<size_t>>();
        std::sort(indices.rbegin(), indices.rend());
        for (size_t idx : indices) {
            auto st = editor.delete_block_at(idx);
            if (!st.ok) return st;
        }
    }
    if (plan.contains("remove_tags")) {
        for (const auto &name : plan.at("remove_tags").get<std::vector<std::string>>()) {
            auto st = editor.remove_tag_row(name);
            if (!st.ok) return st;
        }
    }
    if (plan.contains("tags")) {
        for (const auto &item : plan.at("tags").items()) {
            const std::string value = item.value().get<std::string>();
            auto st = editor.edit_tag_row(item.key(), value);
            if (!st.ok && st.kind == tagforge::ErrorKind::Validation) {
                st = editor.add_tag_row(item.key(), value);
            }
            if (!st.ok) return st;
        }
    }
    if (plan.contains("padding")) {
        const auto &p = plan.at("padding");
        padding_text = p.is_string() ? p.get<std::string>() : p.dump();
    }
    if (plan.contains("cover")) {
        const auto &c = plan.at("cover");
        const std::string image = c.value("image", "");
        if (image.empty()) {
            return validation("cover.image is required");
        }
        std::vector<uint8_t> data;
        auto image_path = std::filesystem::path(image);
        if (image_path.is_relative()) {
            image_path = plan_dir / image_path;
        }
        if (!read_bytes(image_path, data)) {
            return validation("cannot read cover image " + image_path.string());
        }
        std::optional<tagforge::PictureAttributes> attrs;
        if (c.contains("mime") || c.contains("width") || c.contains("height")) {
            tagforge::PictureAttributes a;
            a.mime = c.value("mime", std::string("image/jpeg"));
            a.width = c.value("width", 0u);
            a.height = c.value("height", 0u);
            a.depth = c.value("depth", 0u);
            a.description = c.value("description", std::string());
            attrs = a;
        }
        auto st = editor.set_cover_image(data, attrs);
        if (!st.ok) return st;
    }
    return tagforge::ok_status();
}

int run_apply(const std::string &plan_path, const std::string &padding_flag,
              tagforge::Editor &editor) {
    json plan;
    {
        std::ifstream f(plan_path);
        if (!f.is_open()) {
            TF_LOG("error", "open failed for " << plan_path << " errno=" << errno << " ("
                                               << std::generic_category().message(errno) << ")");
            return 1;
        }
        try {
            f >> plan;
        } catch (const json::exception &e) {
            std::cout << status_json(validation(std::string("invalid plan JSON: ") + e.what()))
                             .dump(2)
                      << "\n";
            return 2;
        }
    }
    std::string padding_text;
    tagforge::Status staged;
    try {
        staged = stage_plan(plan, std::filesystem::path(plan_path).parent_path(), editor,
                            padding_text);
    } catch (const json::exception &e) {
        staged = validation(std::string("invalid plan field: ") + e.what());
    }
    if (!staged.ok) {
        std::cout << status_json(staged).dump(2) << "\n";
        return 2;
    }
    if (!padding_flag.empty()) {
        padding_text = padding_flag;
    }

    tagforge::BatchResult result = editor.save(padding_text);
    if (result.ok() && (plan.contains("vendor") || plan.contains("md5"))) {
        auto merged = editor.info();
        std::string vendor, md5;
        for (const auto &kv : merged) {
            if (kv.first == tagforge::kInfoVendor) vendor = kv.second;
            if (kv.first == tagforge::kInfoMd5) md5 = kv.second;
        }
        vendor = plan.value("vendor", vendor);
        md5 = plan.value("md5", md5);
        auto info_result = editor.save_info(vendor, md5);
        result.status = info_result.status;
        result.advisories.insert(result.advisories.end(), info_result.advisories.begin(),
                                 info_result.advisories.end());
        for (const auto &p : info_result.completed) {
            if (std::find(result.completed.begin(), result.completed.end(), p) ==
                result.completed.end()) {
                result.completed.push_back(p);
            }
        }
    }
    std::cout << batch_json(result).dump(2) << "\n";
    return result.ok() ? 0 : 1;
}

void print_usage() {
    std::cerr << "TagForge " << TAGFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for reading:\n"
              << "  tagforge tags|blocks|info <file.flac>... [--log-level warn|info|debug]\n"
              << "  tagforge cover <file.flac>... [--export-cover PATH]\n"
              << "usage for writing:\n"
              << "  tagforge apply <plan.json> <file.flac>... [--padding BYTES]\n"
              << "Options:\n"
              << "  --log-level LEVEL    Set logging verbosity (default: info).\n"
              << "  --padding BYTES      Rewrite padding as one trailing block of BYTES.\n"
              << "  --export-cover PATH  When reading covers, write the shared cover to PATH.\n"
              << "JSON is always written to stdout.\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TagForge " << TAGFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::filesystem::path export_path;
    std::string padding_flag;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            tagforge::set_log_verbosity(tagforge::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (arg == "--padding" && i + 1 < argc) {
            padding_flag = argv[++i];
        } else if (arg == "--export-cover" && i + 1 < argc) {
            export_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() < 2) {
        print_usage();
        return 2;
    }
    const std::string command = positional[0];
    const bool is_apply = command == "apply";
    if (is_apply && positional.size() < 3) {
        print_usage();
        return 2;
    }
    std::vector<std::string> files(positional.begin() + (is_apply ? 2 : 1), positional.end());

    tagforge::FlacCodec codec;
    tagforge::Editor editor(codec);
    auto st = editor.select_files(files);
    if (!st.ok) {
        TF_LOG("error", "tagforge: failed to load selection: " << tagforge::describe(st));
        std::cout << status_json(st).dump(2) << "\n";
        return 1;
    }

    if (command == "tags") {
        std::cout << tags_json(editor).dump(2) << "\n";
        return editor.tag_view().status.ok ? 0 : 1;
    }
    if (command == "blocks") {
        std::cout << blocks_json(editor).dump(2) << "\n";
        return editor.block_view().status.ok ? 0 : 1;
    }
    if (command == "info") {
        std::cout << info_json(editor).dump(2) << "\n";
        return 0;
    }
    if (command == "cover") {
        std::cout << cover_json(editor, export_path).dump(2) << "\n";
        return 0;
    }
    if (is_apply) {
        return run_apply(positional[1], padding_flag, editor);
    }
    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 2;
}
