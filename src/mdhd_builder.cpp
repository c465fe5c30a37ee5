//
//  mdhd_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mdhd_builder.hpp"

std::unique_ptr<Atom> build_mdhd(uint32_t timescale, uint64_t duration, uint16_t language) {
    auto mdhd = Atom::create("mdhd");
    std::vector<uint8_t> &p = mdhd->payload;
    const bool v1 = duration > 0xFFFFFFFFULL;

    p.reserve(v1 ? 32 : 24);

    write_u8(p, v1 ? 1 : 0);  // version
    write_u24(p, 0);          // flags

    if (v1) {
        write_u64(p, 0);  // creation_time
        write_u64(p, 0);  // modification_time
        write_u32(p, timescale);
        write_u64(p, duration);
    } else {
        write_u32(p, 0);
        write_u32(p, 0);
        write_u32(p, timescale);
        write_u32(p, static_cast<uint32_t>(duration));
    }

    // pad bit + packed ISO-639-2 language.
    write_u16(p, language);
    write_u16(p, 0);  // pre_defined

    return mdhd;
}
