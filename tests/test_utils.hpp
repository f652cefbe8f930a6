// FLAC fixtures for tests only. Block payloads are packed by hand here (kept independent of
// the library encoders to avoid self-consistency bugs).
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "flac_codec.hpp"
#include "flac_file.hpp"
#include "vorbis_comment.hpp"

namespace test_utils {

using Bytes = std::vector<uint8_t>;
using Comments = std::vector<std::pair<std::string, std::string>>;

inline void put_be(Bytes &out, uint64_t v, int bytes) {
    for (int i = bytes - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline void put_le32(Bytes &out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline void put_str(Bytes &out, const std::string &s) { out.insert(out.end(), s.begin(), s.end()); }

inline tagforge::MetadataBlock stream_info_block(uint32_t sample_rate = 44100,
                                                 uint8_t channels = 2, uint8_t bits = 16,
                                                 uint64_t total_samples = 441000,
                                                 uint8_t md5_fill = 0) {
    Bytes p;
    put_be(p, 4096, 2);  // min blocksize
    put_be(p, 4096, 2);  // max blocksize
    put_be(p, 14, 3);    // min framesize
    put_be(p, 9000, 3);  // max framesize
    uint64_t packed = (uint64_t(sample_rate & 0xFFFFF) << 44) |
                      (uint64_t((channels - 1) & 0x7) << 41) |
                      (uint64_t((bits - 1) & 0x1F) << 36) | (total_samples & 0xFFFFFFFFFULL);
    put_be(p, packed, 8);
    p.insert(p.end(), 16, md5_fill);
    return tagforge::MetadataBlock(tagforge::BlockKind::StreamInfo, p);
}

inline tagforge::MetadataBlock vorbis_block(const Comments &comments,
                                            const std::string &vendor = "reference libFLAC") {
    Bytes p;
    put_le32(p, static_cast<uint32_t>(vendor.size()));
    put_str(p, vendor);
    put_le32(p, static_cast<uint32_t>(comments.size()));
    for (const auto &kv : comments) {
        std::string entry = kv.first + "=" + kv.second;
        put_le32(p, static_cast<uint32_t>(entry.size()));
        put_str(p, entry);
    }
    return tagforge::MetadataBlock(tagforge::BlockKind::VorbisComment, p);
}

inline tagforge::MetadataBlock padding_block(size_t size) {
    return tagforge::MetadataBlock(tagforge::BlockKind::Padding, Bytes(size, 0));
}

inline tagforge::MetadataBlock application_block(const std::string &id, const Bytes &data) {
    Bytes p;
    put_str(p, id.substr(0, 4));
    p.insert(p.end(), data.begin(), data.end());
    return tagforge::MetadataBlock(tagforge::BlockKind::Application, p);
}

inline tagforge::MetadataBlock picture_block(const Bytes &image,
                                             const std::string &mime = "image/jpeg",
                                             uint32_t type = 3, uint32_t width = 600,
                                             uint32_t height = 600) {
    Bytes p;
    put_be(p, type, 4);
    put_be(p, mime.size(), 4);
    put_str(p, mime);
    put_be(p, 0, 4);  // description length
    put_be(p, width, 4);
    put_be(p, height, 4);
    put_be(p, 24, 4);  // depth
    put_be(p, 0, 4);   // colors
    put_be(p, image.size(), 4);
    p.insert(p.end(), image.begin(), image.end());
    return tagforge::MetadataBlock(tagforge::BlockKind::Picture, p);
}

// Fake image bytes: JPEG SOI marker followed by a deterministic pattern.
inline Bytes fake_image(size_t size, uint8_t seed = 0) {
    Bytes b(size);
    for (size_t i = 0; i < size; ++i) {
        b[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    if (size >= 2) {
        b[0] = 0xFF;
        b[1] = 0xD8;
    }
    return b;
}

// Complete file: "fLaC", blocks (last flag on the final one), then fake audio frames.
inline Bytes flac_bytes(const std::vector<tagforge::MetadataBlock> &blocks,
                        const Bytes &audio = Bytes{0xFF, 0xF8, 0x69, 0x08, 0x00, 0x12, 0x34}) {
    Bytes out;
    put_str(out, "fLaC");
    for (size_t i = 0; i < blocks.size(); ++i) {
        uint8_t type = blocks[i].code & 0x7F;
        if (i + 1 == blocks.size()) {
            type |= 0x80;
        }
        out.push_back(type);
        put_be(out, blocks[i].payload.size(), 3);
        out.insert(out.end(), blocks[i].payload.begin(), blocks[i].payload.end());
    }
    out.insert(out.end(), audio.begin(), audio.end());
    return out;
}

inline bool write_file(const std::filesystem::path &path, const Bytes &data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return false;
    }
    f.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    return f.good();
}

inline std::optional<Bytes> read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    f.seekg(0, std::ios::end);
    std::streamoff len = f.tellg();
    f.seekg(0, std::ios::beg);
    Bytes buf(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(buf.data()), len);
    if (f.gcount() != len) {
        return std::nullopt;
    }
    return buf;
}

// Scratch directory removed on scope exit.
class TempDir {
   public:
    explicit TempDir(const std::string &label) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("tagforge_" + label + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::string file(const std::string &name) const { return (path_ / name).string(); }

   private:
    std::filesystem::path path_;
};

/**
 * In-memory codec: files live in a map keyed by path. Loads and saves can be made to fail
 * per path to exercise partial-failure behavior.
 */
class MemoryCodec : public tagforge::Codec {
   public:
    void add(const std::string &path, std::vector<tagforge::MetadataBlock> blocks) {
        tagforge::FlacFile f;
        f.path = path;
        f.blocks = std::move(blocks);
        if (const auto *vc = f.find_block(tagforge::BlockKind::VorbisComment)) {
            tagforge::decode_vorbis_comment(vc->payload, f.vendor, f.tags);
        }
        files[path] = std::move(f);
    }

    tagforge::Status load(const std::string &path, tagforge::FlacFile &out) override {
        ++loads;
        auto it = files.find(path);
        if (it == files.end() || fail_load.count(path)) {
            return tagforge::make_error(tagforge::ErrorKind::ContainerRead, "injected load failure",
                                        path);
        }
        out = it->second;
        return tagforge::ok_status();
    }

    tagforge::Status save(tagforge::FlacFile &file,
                          std::optional<uint32_t> padding = std::nullopt) override {
        if (fail_save.count(file.path)) {
            return tagforge::make_error(tagforge::ErrorKind::ContainerWrite,
                                        "injected save failure", file.path);
        }
        tagforge::sync_tags_to_block(file);
        if (padding) {
            tagforge::apply_padding_override(file.blocks, *padding);
        }
        files[file.path] = file;
        saved.push_back(file.path);
        return tagforge::ok_status();
    }

    const tagforge::FlacFile &at(const std::string &path) const { return files.at(path); }

    std::map<std::string, tagforge::FlacFile> files;
    std::set<std::string> fail_load;
    std::set<std::string> fail_save;
    std::vector<std::string> saved;
    int loads = 0;
};

}  // namespace test_utils
