//
//  byte_io.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// FourCC helpers.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

inline uint32_t fourcc(const std::string &s) {
    if (s.size() < 4) {
        throw std::runtime_error("fourcc string too short");
    }
    return fourcc(s[0], s[1], s[2], s[3]);
}

inline bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        if (c < 0x20 || c > 0x7E) {
            return false;
        }
    }
    return true;
}

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}

// ------------- Big-endian readers over raw memory ----------------------------
// Callers bounds-check before reading.

inline uint16_t load_u16(const uint8_t *p) { return uint16_t((p[0] << 8) | p[1]); }

inline uint32_t load_u32(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

inline uint64_t load_u64(const uint8_t *p) {
    return (uint64_t(load_u32(p)) << 32) | uint64_t(load_u32(p + 4));
}

// ------------- Big-endian writers appending to a payload --------------------

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

inline void write_u64(std::vector<uint8_t> &p, uint64_t v) {
    write_u32(p, static_cast<uint32_t>(v >> 32));
    write_u32(p, static_cast<uint32_t>(v & 0xFFFFFFFF));
}

// Overwrite four bytes at `pos` (used when patching chunk offsets).
inline void store_u32(std::vector<uint8_t> &p, size_t pos, uint32_t v) {
    p[pos + 0] = (v >> 24) & 0xFF;
    p[pos + 1] = (v >> 16) & 0xFF;
    p[pos + 2] = (v >> 8) & 0xFF;
    p[pos + 3] = v & 0xFF;
}

inline void store_u64(std::vector<uint8_t> &p, size_t pos, uint64_t v) {
    store_u32(p, pos, static_cast<uint32_t>(v >> 32));
    store_u32(p, pos + 4, static_cast<uint32_t>(v & 0xFFFFFFFF));
}
