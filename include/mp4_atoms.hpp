//
//  mp4_atoms.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "byte_io.hpp"

// Forward declaration.
class Atom;

using AtomPtr = std::unique_ptr<Atom>;

class Atom {
   public:
    uint32_t type = 0;              // FourCC
    std::vector<uint8_t> payload;   // Raw payload (before children)
    std::vector<AtomPtr> children;  // Nested boxes

    uint64_t box_size = 0;  // Computed via fix_size_recursive()

    Atom() = default;
    explicit Atom(uint32_t t) : type(t) {}
    explicit Atom(const char t[4]) : type(fourcc(t)) {}

    // Factory.
    static AtomPtr create(const char t[4]);
    static AtomPtr create(uint32_t t);

    // Add child atom.
    void add(AtomPtr child);

    // Recursive search for atoms of given type (document order).
    std::vector<Atom *> find(const char t[4]);

    // Recursive size computation. Boxes above 4 GB get a 64-bit largesize header.
    void fix_size_recursive();

    // Return size (must call fix_size_recursive first)
    uint64_t size() const;

    // Append the serialized atom to `out`.
    void write(std::vector<uint8_t> &out) const;
};

// Header for a box whose payload is appended by the caller (used for mdat).
void write_box_header(std::vector<uint8_t> &out, uint32_t type, uint64_t payload_size);

// Header size needed for a payload of the given size.
inline uint64_t box_header_size(uint64_t payload_size) {
    return (payload_size + 8 > 0xFFFFFFFFULL) ? 16 : 8;
}
