//
//  mp4_atoms.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mp4_atoms.hpp"

// -----------------------------------------------------------------------------
// Factory.
// -----------------------------------------------------------------------------
AtomPtr Atom::create(const char t[4]) { return std::make_unique<Atom>(t); }

AtomPtr Atom::create(uint32_t t) { return std::make_unique<Atom>(t); }

// -----------------------------------------------------------------------------
// Add child.
// -----------------------------------------------------------------------------
void Atom::add(AtomPtr child) {
    if (child) {
        children.push_back(std::move(child));
    }
}

// -----------------------------------------------------------------------------
// Recursive find.
// -----------------------------------------------------------------------------
std::vector<Atom *> Atom::find(const char t[4]) {
    std::vector<Atom *> result;

    const uint32_t want = fourcc(t);

    if (type == want) {
        result.push_back(this);
    }

    for (auto &child : children) {
        auto sub = child->find(t);
        result.insert(result.end(), sub.begin(), sub.end());
    }

    return result;
}

// -----------------------------------------------------------------------------
// Compute recursive box size.
// -----------------------------------------------------------------------------
void Atom::fix_size_recursive() {
    uint64_t content = payload.size();

    for (auto &c : children) {
        c->fix_size_recursive();
        content += c->box_size;
    }

    box_size = content + box_header_size(content);
}

// -----------------------------------------------------------------------------
// Return box size.
// -----------------------------------------------------------------------------
uint64_t Atom::size() const { return box_size; }

// -----------------------------------------------------------------------------
// Serialize.
// -----------------------------------------------------------------------------
void write_box_header(std::vector<uint8_t> &out, uint32_t type, uint64_t payload_size) {
    if (box_header_size(payload_size) == 16) {
        write_u32(out, 1);  // largesize follows
        write_u32(out, type);
        write_u64(out, payload_size + 16);
    } else {
        write_u32(out, static_cast<uint32_t>(payload_size + 8));
        write_u32(out, type);
    }
}

void Atom::write(std::vector<uint8_t> &out) const {
    const uint64_t header = box_size > 0xFFFFFFFFULL ? 16 : 8;
    write_box_header(out, type, box_size - header);

    out.insert(out.end(), payload.begin(), payload.end());

    for (const auto &c : children) {
        c->write(out);
    }
}
