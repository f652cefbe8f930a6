//
//  flac_codec.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "flac_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "byte_io.hpp"
#include "logging.hpp"
#include "vorbis_comment.hpp"

namespace tagforge {

namespace {

constexpr uint64_t kBlockHeaderSize = 4;
constexpr uint64_t kId3HeaderSize = 10;
constexpr size_t kCopyChunk = 64 * 1024;
constexpr size_t kMaxBlocks = 4096;  // safety bound against corrupted headers

std::string errno_text() {
    return std::to_string(errno) + " (" + std::generic_category().message(errno) + ")";
}

// Size of an ID3v2 tag at the start of the stream, 0 when there is none.
uint64_t id3v2_size(std::istream &in) {
    uint8_t h[kId3HeaderSize];
    in.read(reinterpret_cast<char *>(h), kId3HeaderSize);
    if (in.gcount() != static_cast<std::streamsize>(kId3HeaderSize) || h[0] != 'I' ||
        h[1] != 'D' || h[2] != '3') {
        return 0;
    }
    // Syncsafe size excludes the header; footer present flag adds another 10 bytes.
    uint64_t size = (uint64_t(h[6] & 0x7F) << 21) | (uint64_t(h[7] & 0x7F) << 14) |
                    (uint64_t(h[8] & 0x7F) << 7) | uint64_t(h[9] & 0x7F);
    uint64_t total = kId3HeaderSize + size;
    if (h[5] & 0x10) {
        total += kId3HeaderSize;
    }
    return total;
}

FlacBlockHeader read_block_header(std::istream &in) {
    FlacBlockHeader hdr;
    hdr.offset = static_cast<uint64_t>(in.tellg());
    int first = in.get();
    hdr.is_last = (first & 0x80) != 0;
    hdr.code = static_cast<uint8_t>(first & 0x7F);
    hdr.length = read_u24(in);
    return hdr;
}

std::vector<uint8_t> read_payload(std::istream &in, uint32_t size) {
    std::vector<uint8_t> buf(size);
    in.read(reinterpret_cast<char *>(buf.data()), size);
    return buf;
}

bool copy_range(std::ifstream &in, std::ofstream &out, uint64_t from, uint64_t to) {
    if (to <= from) {
        return true;
    }
    in.clear();
    in.seekg(static_cast<std::streamoff>(from), std::ios::beg);
    std::vector<char> buf(kCopyChunk);
    uint64_t left = to - from;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(left, buf.size()));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want) {
            return false;
        }
        out.write(buf.data(), static_cast<std::streamsize>(want));
        if (!out.good()) {
            return false;
        }
        left -= want;
    }
    return true;
}

}  // namespace

Status parse_metadata(std::istream &in, const std::string &path, FlacFile &out) {
    in.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(in.tellg());
    in.seekg(0, std::ios::beg);

    uint64_t marker = id3v2_size(in);
    if (marker > 0) {
        TF_LOG("codec", "skipping ID3v2 prefix of " << marker << " bytes in " << path);
    }
    in.clear();
    in.seekg(static_cast<std::streamoff>(marker), std::ios::beg);
    char magic[4] = {0, 0, 0, 0};
    in.read(magic, 4);
    if (!in || std::memcmp(magic, "fLaC", 4) != 0) {
        return make_error(ErrorKind::ContainerRead, "not a FLAC file (missing fLaC marker)",
                          path);
    }

    out.path = path;
    out.blocks.clear();
    out.tags.clear();
    out.vendor.clear();
    out.marker_offset = marker;

    bool last = false;
    while (!last) {
        if (out.blocks.size() >= kMaxBlocks) {
            return make_error(ErrorKind::ContainerRead, "too many metadata blocks", path);
        }
        FlacBlockHeader hdr = read_block_header(in);
        if (!in) {
            return make_error(ErrorKind::ContainerRead,
                              "truncated block header at offset " + std::to_string(hdr.offset),
                              path);
        }
        if (hdr.code == 0x7F) {
            return make_error(ErrorKind::ContainerRead,
                              "invalid block type 127 at offset " + std::to_string(hdr.offset),
                              path);
        }
        if (hdr.offset + kBlockHeaderSize + hdr.length > file_size) {
            return make_error(ErrorKind::ContainerRead,
                              "block at offset " + std::to_string(hdr.offset) + " claims " +
                                  std::to_string(hdr.length) + " bytes past end of file",
                              path);
        }
        out.blocks.emplace_back(hdr.code, read_payload(in, hdr.length));
        TF_LOG("codec", "block " << (out.blocks.size() - 1) << " code="
                                 << static_cast<int>(hdr.code) << " ("
                                 << block_type_name(classify(hdr.code)) << ") len="
                                 << hdr.length << " last=" << hdr.is_last);
        last = hdr.is_last;
    }
    out.audio_offset = static_cast<uint64_t>(in.tellg());
    return ok_status();
}

Status FlacCodec::load(const std::string &path, FlacFile &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        TF_LOG("error", "open failed for " << path << " errno=" << errno_text());
        return make_error(ErrorKind::ContainerRead, "cannot open: " + errno_text(), path);
    }
    FlacFile file;
    Status st = parse_metadata(f, path, file);
    if (!st.ok) {
        TF_LOG("warn", "load failed: " << describe(st));
        return st;
    }
    size_t stream_infos = file.count_blocks(BlockKind::StreamInfo);
    if (stream_infos != 1) {
        return make_error(ErrorKind::ContainerRead,
                          "expected exactly one STREAMINFO block, found " +
                              std::to_string(stream_infos),
                          path);
    }
    for (auto kind : {BlockKind::SeekTable, BlockKind::VorbisComment}) {
        if (file.count_blocks(kind) > 1) {
            TF_LOG("warn", path << ": more than one " << block_type_name(kind)
                                << " block; only the first is used");
        }
    }
    if (const MetadataBlock *vc = file.find_block(BlockKind::VorbisComment)) {
        if (!decode_vorbis_comment(vc->payload, file.vendor, file.tags)) {
            return make_error(ErrorKind::ContainerRead, "malformed VORBIS_COMMENT block", path);
        }
    }
    TF_LOG("debug", "loaded " << path << " blocks=" << file.blocks.size()
                              << " tags=" << file.tags.size()
                              << " audio_offset=" << file.audio_offset);
    out = std::move(file);
    return ok_status();
}

void apply_padding_override(std::vector<MetadataBlock> &blocks, uint32_t size) {
    std::vector<MetadataBlock> kept;
    kept.reserve(blocks.size() + 1);
    for (auto &b : blocks) {
        if (b.kind() != BlockKind::Padding) {
            kept.push_back(std::move(b));
        }
    }
    kept.emplace_back(BlockKind::Padding, std::vector<uint8_t>(size, 0));
    blocks = std::move(kept);
}

Status serialize_metadata(const std::vector<MetadataBlock> &blocks, std::vector<uint8_t> &out) {
    out.clear();
    write_bytes(out, std::string("fLaC"));
    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto &b = blocks[i];
        if (b.payload.size() > kMaxBlockPayload) {
            return make_error(ErrorKind::ContainerWrite,
                              std::string(block_type_name(b.kind())) + " block of " +
                                  std::to_string(b.payload.size()) +
                                  " bytes exceeds the 16 MiB block limit");
        }
        uint8_t type = b.code & 0x7F;
        if (i + 1 == blocks.size()) {
            type |= 0x80;
        }
        write_u8(out, type);
        write_u24(out, static_cast<uint32_t>(b.payload.size()));
        write_bytes(out, b.payload);
    }
    return ok_status();
}

Status FlacCodec::save(FlacFile &file, std::optional<uint32_t> padding) {
    const std::string &path = file.path;
    if (file.count_blocks(BlockKind::StreamInfo) != 1) {
        return make_error(ErrorKind::ContainerWrite,
                          "refusing to write without exactly one STREAMINFO block", path);
    }
    sync_tags_to_block(file);
    if (padding) {
        apply_padding_override(file.blocks, *padding);
    }

    std::vector<uint8_t> metadata;
    Status st = serialize_metadata(file.blocks, metadata);
    if (!st.ok) {
        st.path = path;
        return st;
    }

    // Write through symlinks: the temp file and rename target the resolved file.
    std::error_code ec;
    const std::filesystem::path target = std::filesystem::canonical(path, ec);
    if (ec) {
        return make_error(ErrorKind::ContainerWrite, "cannot resolve path: " + ec.message(),
                          path);
    }
    const auto perms = std::filesystem::status(target, ec).permissions();
    if (ec) {
        return make_error(ErrorKind::ContainerWrite, "cannot stat file: " + ec.message(), path);
    }

    std::ifstream src(target, std::ios::binary);
    if (!src.is_open()) {
        TF_LOG("error", "open failed for " << path << " errno=" << errno_text());
        return make_error(ErrorKind::ContainerWrite, "cannot reopen source: " + errno_text(),
                          path);
    }
    src.seekg(0, std::ios::end);
    const uint64_t src_size = static_cast<uint64_t>(src.tellg());
    if (file.audio_offset > src_size || file.marker_offset > src_size) {
        return make_error(ErrorKind::ContainerWrite, "file changed on disk since it was loaded",
                          path);
    }

    const std::string tmp_path = target.string() + ".tagforge-tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            TF_LOG("error", "open failed for " << tmp_path << " errno=" << errno_text());
            return make_error(ErrorKind::ContainerWrite, "cannot create temp file: " + errno_text(),
                              path);
        }
        bool ok = copy_range(src, out, 0, file.marker_offset);
        if (ok) {
            out.write(reinterpret_cast<const char *>(metadata.data()),
                      static_cast<std::streamsize>(metadata.size()));
            ok = out.good();
        }
        ok = ok && copy_range(src, out, file.audio_offset, src_size);
        out.flush();
        ok = ok && out.good();
        if (!ok) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            return make_error(ErrorKind::ContainerWrite, "write failed: " + errno_text(), path);
        }
    }
    src.close();

    std::filesystem::permissions(tmp_path, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return make_error(ErrorKind::ContainerWrite, "cannot set permissions: " + ec.message(),
                          path);
    }
    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return make_error(ErrorKind::ContainerWrite, "rename failed: " + ec.message(), path);
    }
    file.audio_offset = file.marker_offset + metadata.size();
    TF_LOG("debug", "saved " << path << " blocks=" << file.blocks.size()
                             << " metadata_bytes=" << metadata.size());
    return ok_status();
}

}  // namespace tagforge
