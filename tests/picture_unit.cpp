// Front cover consistency, replacement across files, and export.
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "picture_consistency.hpp"
#include "test_utils.hpp"

namespace {

using tagforge::BlockKind;
using tagforge::ErrorKind;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[picture_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

tagforge::FlacFile with_blocks(const std::string &path,
                               std::vector<tagforge::MetadataBlock> blocks) {
    tagforge::FlacFile f;
    f.path = path;
    f.blocks = std::move(blocks);
    return f;
}

size_t count_front_covers(const tagforge::FlacFile &f) {
    size_t n = 0;
    for (const auto &b : f.blocks) {
        if (b.kind() != BlockKind::Picture) {
            continue;
        }
        auto pic = tagforge::decode_picture(b.payload);
        if (pic && pic->type == tagforge::kPictureTypeFrontCover) {
            ++n;
        }
    }
    return n;
}

bool test_picture_round_trip() {
    tagforge::Picture pic;
    pic.attributes.mime = "image/png";
    pic.attributes.description = "front";
    pic.attributes.width = 300;
    pic.attributes.height = 200;
    pic.attributes.depth = 32;
    pic.data = test_utils::fake_image(64);
    auto decoded = tagforge::decode_picture(tagforge::encode_picture(pic));
    bool ok = check(decoded.has_value(), "encoded picture decodes");
    if (decoded) {
        ok &= check(decoded->attributes.mime == "image/png" &&
                        decoded->attributes.description == "front",
                    "strings survive");
        ok &= check(decoded->attributes.width == 300 && decoded->attributes.height == 200,
                    "dimensions survive");
        ok &= check(decoded->data == pic.data, "image bytes survive");
    }
    auto payload = tagforge::encode_picture(pic);
    payload.resize(payload.size() - 1);
    ok &= check(!tagforge::decode_picture(payload), "truncated payload rejected");
    return ok;
}

bool test_consistency() {
    auto img = test_utils::fake_image(500);
    auto a = with_blocks("a.flac", {test_utils::stream_info_block(), test_utils::picture_block(img)});
    auto b = with_blocks("b.flac", {test_utils::stream_info_block(),
                                    test_utils::picture_block(img, "image/jpeg", 3, 1, 1)});
    bool ok = check(tagforge::check_picture_consistency({a, b}),
                    "same image bytes, attributes ignored");

    auto changed = img;
    changed[250] ^= 0x01;
    auto c = with_blocks("c.flac",
                         {test_utils::stream_info_block(), test_utils::picture_block(changed)});
    ok &= check(!tagforge::check_picture_consistency({a, b, c}), "one byte difference detected");

    auto bare = with_blocks("d.flac", {test_utils::stream_info_block()});
    ok &= check(!tagforge::check_picture_consistency({a, bare}), "cover in only some files");
    ok &= check(tagforge::check_picture_consistency({bare, bare}), "no covers anywhere");

    // A back cover (type 4) is not the front cover.
    auto back = with_blocks("e.flac", {test_utils::stream_info_block(),
                                       test_utils::picture_block(img, "image/jpeg", 4)});
    ok &= check(!tagforge::front_cover(back), "back cover ignored");
    ok &= check(tagforge::check_picture_consistency({back, bare}), "back covers do not count");
    return ok;
}

bool test_set_front_cover() {
    auto old_img = test_utils::fake_image(80, 1);
    auto f = with_blocks("a.flac",
                         {test_utils::stream_info_block(), test_utils::picture_block(old_img),
                          test_utils::picture_block(old_img, "image/jpeg", 4),
                          test_utils::picture_block(old_img), test_utils::padding_block(16)});
    tagforge::PictureAttributes attrs;
    attrs.width = 10;
    attrs.height = 20;
    auto new_img = test_utils::fake_image(90, 2);
    tagforge::set_front_cover(f, new_img, attrs);

    bool ok = check(count_front_covers(f) == 1, "exactly one front cover left");
    ok &= check(f.blocks.size() == 4, "back cover kept, old front covers removed");
    ok &= check(f.blocks.back().kind() == BlockKind::Padding, "padding stays last");
    ok &= check(f.blocks[2].kind() == BlockKind::Picture, "new cover inserted before padding");
    auto cover = tagforge::front_cover(f);
    ok &= check(cover && cover->data == new_img && cover->attributes.height == 20,
                "new cover content");

    auto g = with_blocks("b.flac", {test_utils::stream_info_block()});
    tagforge::set_front_cover(g, new_img, attrs);
    ok &= check(g.blocks.size() == 2 && g.blocks[1].kind() == BlockKind::Picture,
                "appended when there is no trailing padding");
    return ok;
}

bool test_apply_picture() {
    test_utils::MemoryCodec codec;
    codec.add("a.flac", {test_utils::stream_info_block(),
                         test_utils::picture_block(test_utils::fake_image(100, 1)),
                         test_utils::padding_block(16)});
    codec.add("b.flac", {test_utils::stream_info_block(), test_utils::padding_block(16)});
    tagforge::Selection sel(2);
    codec.load("a.flac", sel[0]);
    codec.load("b.flac", sel[1]);
    bool ok = check(!tagforge::check_picture_consistency(sel), "covers differ before");

    auto image = test_utils::fake_image(12345, 7);
    tagforge::PictureAttributes attrs;
    auto result = tagforge::apply_picture(sel, image, attrs, codec);
    ok &= check(result.ok() && result.completed.size() == 2, "cover applied to both files");

    tagforge::Selection reread(2);
    codec.load("a.flac", reread[0]);
    codec.load("b.flac", reread[1]);
    ok &= check(tagforge::check_picture_consistency(reread), "covers agree after apply");
    auto cover = tagforge::front_cover(reread[1]);
    ok &= check(cover && cover->data.size() == 12345, "12345 byte image stored");

    result = tagforge::apply_picture(sel, {}, attrs, codec);
    ok &= check(!result.ok() && result.status.kind == ErrorKind::Validation,
                "empty image rejected");

    codec.fail_save.insert("b.flac");
    result = tagforge::apply_picture(sel, test_utils::fake_image(50, 3), attrs, codec);
    ok &= check(!result.ok() && result.completed == std::vector<std::string>({"a.flac"}),
                "first failure stops the loop");
    return ok;
}

bool test_export_cover() {
    test_utils::TempDir dir("picture");
    auto img = test_utils::fake_image(256, 9);
    auto f = with_blocks("a.flac", {test_utils::stream_info_block(), test_utils::picture_block(img)});
    const std::string out = dir.file("cover.jpg");
    auto st = tagforge::export_cover(f, out);
    bool ok = check(st.ok, "export succeeds");
    auto written = test_utils::read_file(out);
    ok &= check(written && *written == img, "exported bytes match");

    auto bare = with_blocks("b.flac", {test_utils::stream_info_block()});
    st = tagforge::export_cover(bare, dir.file("none.jpg"));
    ok &= check(!st.ok && st.kind == ErrorKind::Validation, "nothing to export");
    return ok;
}

bool test_attributes_from_image() {
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00,
                                0x00, 0x0D, 'I',  'H', 'D', 'R',  0x00, 0x00, 0x00, 0x40,
                                0x00, 0x00, 0x00, 0x20, 0x08, 0x02, 0x00, 0x00, 0x00};
    auto attrs = tagforge::picture_attributes_from_image(png);
    bool ok = check(attrs && attrs->mime == "image/png" && attrs->width == 64 &&
                        attrs->height == 32 && attrs->depth == 24,
                    "attributes probed from PNG header");
    ok &= check(!tagforge::picture_attributes_from_image({1, 2, 3}), "unknown format");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_picture_round_trip();
    ok &= test_consistency();
    ok &= test_set_front_cover();
    ok &= test_apply_picture();
    ok &= test_export_cover();
    ok &= test_attributes_from_image();
    return ok ? 0 : 1;
}
