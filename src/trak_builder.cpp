//
//  trak_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "trak_builder.hpp"

#include <cstdint>
#include <memory>

#include "hdlr_builder.hpp"
#include "mdhd_builder.hpp"
#include "media_header_builder.hpp"
#include "mp4_atoms.hpp"
#include "tkhd_builder.hpp"

std::unique_ptr<Atom> build_edts(uint64_t empty_edit, uint64_t track_duration) {
    auto edts = Atom::create("edts");
    auto elst = Atom::create("elst");
    auto &p = elst->payload;
    const bool v1 = track_duration > 0xFFFFFFFFULL;

    auto write_entry = [&](uint64_t segment_duration, int64_t media_time) {
        if (v1) {
            write_u64(p, segment_duration);
            write_u64(p, static_cast<uint64_t>(media_time));
        } else {
            write_u32(p, static_cast<uint32_t>(segment_duration));
            write_u32(p, static_cast<uint32_t>(static_cast<int32_t>(media_time)));
        }
        write_u32(p, 0x00010000);  // media_rate 1.0
    };

    write_u8(p, v1 ? 1 : 0);
    write_u24(p, 0);
    write_u32(p, 2);  // entry count
    write_entry(empty_edit, -1);
    write_entry(track_duration > empty_edit ? track_duration - empty_edit : 0, 0);

    edts->add(std::move(elst));
    return edts;
}

std::unique_ptr<Atom> build_trak(const clipsplice::TrackDescriptor &track, uint32_t track_id,
                                 uint64_t media_duration, uint64_t empty_edit,
                                 uint64_t track_duration, std::unique_ptr<Atom> stbl) {
    auto trak = Atom::create("trak");

    trak->add(build_tkhd(track, track_id, track_duration));
    if (empty_edit > 0) {
        trak->add(build_edts(empty_edit, track_duration));
    }

    auto mdia = Atom::create("mdia");
    mdia->add(build_mdhd(static_cast<uint32_t>(track.timescale), media_duration, track.language));
    mdia->add(build_hdlr(track.handler_type, track.handler_name));

    auto minf = Atom::create("minf");
    minf->add(build_media_header(track.media_type));
    minf->add(build_dinf());
    minf->add(std::move(stbl));

    mdia->add(std::move(minf));
    trak->add(std::move(mdia));

    return trak;
}
