//
//  byte_io.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_io.hpp"

uint32_t read_u24(std::istream &in) {
    uint8_t b[3];
    in.read(reinterpret_cast<char *>(b), 3);
    return (uint32_t(b[0]) << 16) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]));
}

uint32_t read_u32(std::istream &in) {
    uint8_t b[4];
    in.read(reinterpret_cast<char *>(b), 4);
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           (uint32_t(b[3]));
}

bool ByteReader::need(size_t n) {
    if (failed_ || data_.size() - pos_ < n) {
        failed_ = true;
        return false;
    }
    return true;
}

uint8_t ByteReader::u8() {
    if (!need(1)) {
        return 0;
    }
    return data_[pos_++];
}

uint16_t ByteReader::u16() {
    if (!need(2)) {
        return 0;
    }
    uint16_t v = (uint16_t(data_[pos_]) << 8) | uint16_t(data_[pos_ + 1]);
    pos_ += 2;
    return v;
}

uint32_t ByteReader::u24() {
    if (!need(3)) {
        return 0;
    }
    uint32_t v = (uint32_t(data_[pos_]) << 16) | (uint32_t(data_[pos_ + 1]) << 8) |
                 uint32_t(data_[pos_ + 2]);
    pos_ += 3;
    return v;
}

uint32_t ByteReader::u32() {
    if (!need(4)) {
        return 0;
    }
    uint32_t v = (uint32_t(data_[pos_]) << 24) | (uint32_t(data_[pos_ + 1]) << 16) |
                 (uint32_t(data_[pos_ + 2]) << 8) | uint32_t(data_[pos_ + 3]);
    pos_ += 4;
    return v;
}

uint32_t ByteReader::u32_le() {
    if (!need(4)) {
        return 0;
    }
    uint32_t v = uint32_t(data_[pos_]) | (uint32_t(data_[pos_ + 1]) << 8) |
                 (uint32_t(data_[pos_ + 2]) << 16) | (uint32_t(data_[pos_ + 3]) << 24);
    pos_ += 4;
    return v;
}

uint64_t ByteReader::u64() {
    uint64_t hi = u32();
    uint64_t lo = u32();
    return (hi << 32) | lo;
}

std::string ByteReader::str(size_t len) {
    if (!need(len)) {
        return {};
    }
    std::string s(data_.begin() + pos_, data_.begin() + pos_ + len);
    pos_ += len;
    return s;
}

std::vector<uint8_t> ByteReader::bytes(size_t len) {
    if (!need(len)) {
        return {};
    }
    std::vector<uint8_t> out(data_.begin() + pos_, data_.begin() + pos_ + len);
    pos_ += len;
    return out;
}
