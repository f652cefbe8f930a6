//
//  byte_io.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

// ------------- Helper write functions ---------------------------------------
// FLAC block headers and STREAMINFO/PICTURE fields are big-endian; VORBIS_COMMENT
// lengths are little-endian.

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u24(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_bytes(std::vector<uint8_t> &p, const std::string &s) {
    p.insert(p.end(), s.begin(), s.end());
}

inline void write_bytes(std::vector<uint8_t> &p, const std::vector<uint8_t> &data) {
    p.insert(p.end(), data.begin(), data.end());
}

// ------------- Helper read functions ----------------------------------------

// Utility: read big-endian 24-bit value.
uint32_t read_u24(std::istream &in);

// Utility: read big-endian 32-bit value.
uint32_t read_u32(std::istream &in);

/**
 * @brief Bounds-checked cursor over a block payload.
 *
 * Every read past the end sets `failed` and yields zero / empty data, so decoders can check
 * once at the end instead of after every field.
 */
class ByteReader {
   public:
    explicit ByteReader(const std::vector<uint8_t> &data) : data_(data) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u24();
    uint32_t u32();
    uint32_t u32_le();
    uint64_t u64();
    std::string str(size_t len);
    std::vector<uint8_t> bytes(size_t len);

    size_t remaining() const { return failed_ ? 0 : data_.size() - pos_; }
    size_t position() const { return pos_; }
    bool failed() const { return failed_; }

   private:
    bool need(size_t n);

    const std::vector<uint8_t> &data_;
    size_t pos_ = 0;
    bool failed_ = false;
};
