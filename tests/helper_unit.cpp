// Unit coverage for small helpers: byte readers, block catalog, hashing, image probing,
// and display formatting.
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "block_catalog.hpp"
#include "byte_io.hpp"
#include "content_hash.hpp"
#include "image_info.hpp"
#include "info_merger.hpp"
#include "logging.hpp"
#include "status.hpp"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_endian_readers() {
    std::istringstream s24(std::string("\x01\x02\x03", 3));
    bool ok = check(read_u24(s24) == 0x010203u, "read_u24 big-endian decode");
    std::istringstream s32(std::string("\x01\x02\x03\x04", 4));
    ok &= check(read_u32(s32) == 0x01020304u, "read_u32 big-endian decode");

    std::vector<uint8_t> data = {0x04, 0x03, 0x02, 0x01, 0xAA, 'f', 'L', 'a', 'C'};
    ByteReader r(data);
    ok &= check(r.u32_le() == 0x01020304u, "ByteReader::u32_le little-endian decode");
    ok &= check(r.u8() == 0xAA, "ByteReader::u8");
    ok &= check(r.str(4) == "fLaC", "ByteReader::str");
    ok &= check(!r.failed() && r.remaining() == 0, "ByteReader consumed everything");
    ok &= check(r.u16() == 0 && r.failed(), "ByteReader flags reads past the end");
    ok &= check(r.remaining() == 0, "failed reader reports nothing remaining");
    return ok;
}

bool test_writers() {
    std::vector<uint8_t> out;
    write_u24(out, 0x0A0B0C);
    write_u32_le(out, 0x11223344);
    bool ok = check(out.size() == 7, "writer sizes");
    ok &= check(out[0] == 0x0A && out[1] == 0x0B && out[2] == 0x0C, "write_u24 big-endian");
    ok &= check(out[3] == 0x44 && out[6] == 0x11, "write_u32_le little-endian");
    return ok;
}

bool test_hex_prefix() {
    using tagforge::hex_prefix;
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd ff", "hex_prefix default prints all up to limit");
    return ok;
}

bool test_log_levels() {
    using tagforge::LogVerbosity;
    using tagforge::parse_log_verbosity;
    bool ok = check(parse_log_verbosity("debug") == LogVerbosity::Debug, "parse debug");
    ok &= check(parse_log_verbosity("warn") == LogVerbosity::Warn, "parse warn");
    ok &= check(parse_log_verbosity("info") == LogVerbosity::Info, "parse info");
    ok &= check(parse_log_verbosity("bogus") == LogVerbosity::Error, "unknown level maps to error");
    ok &= check(tf_severity_for_tag("reconcile") == LogVerbosity::Debug,
                "component tags log at debug");
    return ok;
}

bool test_block_catalog() {
    using namespace tagforge;
    bool ok = check(classify(4) == BlockKind::VorbisComment, "code 4 is VORBIS_COMMENT");
    ok &= check(classify(6) == BlockKind::Picture, "code 6 is PICTURE");
    ok &= check(classify(9) == BlockKind::Unknown, "reserved code is Unknown");
    ok &= check(std::string(block_type_name(BlockKind::StreamInfo)) == "STREAMINFO",
                "STREAMINFO display name");
    ok &= check(std::string(block_type_name(classify(42))) == "UNKNOWN", "UNKNOWN display name");
    ok &= check(!is_deletable(BlockKind::StreamInfo), "STREAMINFO not deletable");
    ok &= check(is_deletable(BlockKind::Padding) && is_deletable(BlockKind::Unknown),
                "other kinds deletable");
    ok &= check(must_be_last(BlockKind::Padding) && !must_be_last(BlockKind::Picture),
                "only PADDING must be last");
    ok &= check(is_unique(BlockKind::VorbisComment) && !is_unique(BlockKind::Picture),
                "uniqueness rules");
    return ok;
}

bool test_content_hash() {
    using namespace tagforge;
    const std::vector<uint8_t> abc = {'a', 'b', 'c'};
    bool ok = check(to_hex(sha256(abc)) ==
                        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                    "sha256(abc) known answer");

    // Same payload under different codes hashes identically; the code is paired separately.
    MetadataBlock a(BlockKind::Padding, abc);
    MetadataBlock b(BlockKind::Application, abc);
    ok &= check(content_hash(a) == content_hash(b), "hash covers payload only");
    MetadataBlock c(BlockKind::Padding, std::vector<uint8_t>{'a', 'b', 'd'});
    ok &= check(content_hash(a) != content_hash(c), "one byte changes the hash");

    auto parsed = content_hash_from_hex(to_hex(content_hash(a)));
    ok &= check(parsed && *parsed == content_hash(a), "hex digest parses back");
    ok &= check(!content_hash_from_hex("xyz"), "short hex digest rejected");
    return ok;
}

bool test_file_md5() {
    test_utils::TempDir dir("helper");
    const std::string path = dir.file("abc.bin");
    bool ok = check(test_utils::write_file(path, {'a', 'b', 'c'}), "write md5 fixture");
    auto md5 = tagforge::file_md5_hex(path);
    ok &= check(md5 && *md5 == "900150983cd24fb0d6963f7d28e17f72", "md5(abc) known answer");
    ok &= check(!tagforge::file_md5_hex(dir.file("missing.bin")), "missing file yields nullopt");
    return ok;
}

bool test_image_probe() {
    using namespace tagforge;
    // SOI, APP0 stub, SOF0 with 8 bit precision, 480x640, 3 components.
    std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x04, 0x00, 0x00,
                                 0xFF, 0xC0, 0x00, 0x11, 0x08, 0x01, 0xE0, 0x02,
                                 0x80, 0x03, 0x01, 0x22, 0x00, 0x02, 0x11, 0x01,
                                 0x03, 0x11, 0x01, 0xFF, 0xD9};
    auto info = probe_image(jpeg);
    bool ok = check(info.has_value(), "JPEG probe succeeds");
    if (info) {
        ok &= check(info->mime == "image/jpeg", "JPEG mime");
        ok &= check(info->width == 640 && info->height == 480, "JPEG dimensions 640x480");
        ok &= check(info->depth == 24, "JPEG depth is precision * components");
    }

    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00,
                                0x00, 0x0D, 'I',  'H', 'D', 'R',  0x00, 0x00, 0x01, 0x00,
                                0x00, 0x00, 0x00, 0x80, 0x08, 0x06, 0x00, 0x00, 0x00};
    info = probe_image(png);
    ok &= check(info.has_value(), "PNG probe succeeds");
    if (info) {
        ok &= check(info->mime == "image/png", "PNG mime");
        ok &= check(info->width == 256 && info->height == 128, "PNG dimensions 256x128");
        ok &= check(info->depth == 32, "RGBA PNG depth");
    }

    ImageInfo untouched;
    untouched.width = 123;
    ok &= check(!parse_jpeg_info(png, untouched), "PNG signature is not a JPEG");
    ok &= check(untouched.width == 123, "failed parse leaves info untouched");
    ok &= check(!probe_image({0x00, 0x01, 0x02}), "garbage is not an image");
    return ok;
}

bool test_formatting() {
    using namespace tagforge;
    bool ok = check(format_size(0) == "0 B", "format_size zero");
    ok &= check(format_size(512) == "512.00 B", "format_size bytes");
    ok &= check(format_size(1536) == "1.50 KB", "format_size kilobytes");
    ok &= check(format_size(3u * 1024 * 1024) == "3.00 MB", "format_size megabytes");
    ok &= check(format_seconds(0) == "00:00:00", "format_seconds zero");
    ok &= check(format_seconds(3725.9) == "01:02:05", "format_seconds truncates");

    Status st = make_error(ErrorKind::ContainerWrite, "disk full", "/music/a.flac");
    ok &= check(describe(st) == "ContainerWriteError: disk full (/music/a.flac)",
                "describe formats kind, message and path");
    ok &= check(describe(ok_status()) == "ok", "describe ok");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_endian_readers();
    ok &= test_writers();
    ok &= test_hex_prefix();
    ok &= test_log_levels();
    ok &= test_block_catalog();
    ok &= test_content_hash();
    ok &= test_file_md5();
    ok &= test_image_probe();
    ok &= test_formatting();
    return ok ? 0 : 1;
}
