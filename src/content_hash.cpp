//
//  content_hash.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "content_hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>

#include "logging.hpp"

namespace tagforge {

namespace {

constexpr size_t kFileReadChunk = 64 * 1024;

using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpCtxPtr make_ctx() { return EvpCtxPtr(EVP_MD_CTX_new(), &EVP_MD_CTX_free); }

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

ContentHash sha256(const std::vector<uint8_t> &data) {
    ContentHash out{};
    auto ctx = make_ctx();
    unsigned int len = 0;
    // SHA-256 only fails on allocation failure; an all-zero digest is returned then.
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
        TF_LOG("error", "sha256: EVP digest failed");
        out.fill(0);
    }
    return out;
}

ContentHash content_hash(const MetadataBlock &block) {
    ContentHash h = sha256(block.payload);
    TF_LOG("hash", "block code=" << static_cast<int>(block.code)
                                 << " bytes=" << block.payload.size() << " sha256="
                                 << to_hex(h.data(), 8) << "...");
    return h;
}

std::optional<std::string> file_md5_hex(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        TF_LOG("warn", "md5: open failed for " << path);
        return std::nullopt;
    }
    auto ctx = make_ctx();
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return std::nullopt;
    }
    std::vector<char> buf(kFileReadChunk);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = f.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (f.bad()) {
        TF_LOG("warn", "md5: read failed for " << path);
        return std::nullopt;
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return std::nullopt;
    }
    return to_hex(digest, len);
}

std::string to_hex(const uint8_t *data, size_t len) {
    static const char kDigits[] = "0123456789abcdef";
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        s.push_back(kDigits[data[i] >> 4]);
        s.push_back(kDigits[data[i] & 0x0F]);
    }
    return s;
}

std::string to_hex(const ContentHash &hash) { return to_hex(hash.data(), hash.size()); }

std::optional<ContentHash> content_hash_from_hex(const std::string &hex) {
    if (hex.size() != kContentHashSize * 2) {
        return std::nullopt;
    }
    ContentHash out{};
    for (size_t i = 0; i < kContentHashSize; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

}  // namespace tagforge
