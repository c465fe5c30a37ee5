//
//  tkhd_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tkhd_builder.hpp"

std::unique_ptr<Atom> build_tkhd(const clipsplice::TrackDescriptor &track, uint32_t track_id,
                                 uint64_t duration) {
    auto tkhd = Atom::create("tkhd");
    std::vector<uint8_t> &p = tkhd->payload;
    const bool v1 = duration > 0xFFFFFFFFULL;

    p.reserve(v1 ? 96 : 84);

    write_u8(p, v1 ? 1 : 0);      // version
    write_u24(p, track.tkhd_flags);  // enabled / in movie / in preview

    if (v1) {
        write_u64(p, 0);  // creation_time
        write_u64(p, 0);  // modification_time
        write_u32(p, track_id);
        write_u32(p, 0);  // reserved
        write_u64(p, duration);
    } else {
        write_u32(p, 0);
        write_u32(p, 0);
        write_u32(p, track_id);
        write_u32(p, 0);
        write_u32(p, static_cast<uint32_t>(duration));
    }

    write_u64(p, 0);  // reserved[2]

    write_u16(p, track.layer);
    write_u16(p, track.alternate_group);
    write_u16(p, track.volume);  // 0x0100 for audio, 0 for others
    write_u16(p, 0);             // reserved

    for (uint32_t v : track.matrix) {
        write_u32(p, v);
    }

    // width, height (16.16 fixed, copied raw)
    write_u32(p, track.width);
    write_u32(p, track.height);

    return tkhd;
}
