//
//  mvhd_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mvhd_builder.hpp"

std::unique_ptr<Atom> build_mvhd(uint32_t timescale, uint64_t duration, uint32_t next_track_id) {
    auto mvhd = Atom::create("mvhd");
    const bool v1 = duration > 0xFFFFFFFFULL;

    // 100 bytes for version 0, 112 for version 1.
    std::vector<uint8_t> &p = mvhd->payload;
    p.reserve(v1 ? 112 : 100);

    write_u8(p, v1 ? 1 : 0);
    write_u24(p, 0);

    // creation_time + modification_time, then timescale + duration.
    if (v1) {
        write_u64(p, 0);
        write_u64(p, 0);
        write_u32(p, timescale);
        write_u64(p, duration);
    } else {
        write_u32(p, 0);
        write_u32(p, 0);
        write_u32(p, timescale);
        write_u32(p, static_cast<uint32_t>(duration));
    }

    write_u32(p, 0x00010000);  // rate 1.0
    write_u16(p, 0x0100);      // volume 1.0

    // reserved.
    write_u16(p, 0);
    write_u64(p, 0);

    // unity matrix.
    static const uint32_t matrix[9] = {0x00010000, 0, 0, 0, 0x00010000, 0, 0, 0, 0x40000000};
    for (uint32_t v : matrix) {
        write_u32(p, v);
    }

    // pre_defined[6].
    for (int i = 0; i < 6; ++i) {
        write_u32(p, 0);
    }

    write_u32(p, next_track_id);

    return mvhd;
}
