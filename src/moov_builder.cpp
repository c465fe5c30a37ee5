//
//  moov_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "moov_builder.hpp"

#include "mvhd_builder.hpp"

std::unique_ptr<Atom> build_moov(uint32_t timescale, uint64_t duration,
                                 std::vector<std::unique_ptr<Atom>> traks) {
    auto moov = Atom::create("moov");

    // Tracks are numbered 1..N by the writer.
    moov->add(build_mvhd(timescale, duration, static_cast<uint32_t>(traks.size() + 1)));
    for (auto &t : traks) {
        moov->add(std::move(t));
    }

    return moov;
}

std::unique_ptr<Atom> build_ftyp() {
    auto ftyp = Atom::create("ftyp");
    auto &p = ftyp->payload;

    write_u32(p, fourcc("isom"));  // major brand
    write_u32(p, 0x200);           // minor version
    for (const char *brand : {"isom", "iso2", "avc1", "mp41"}) {
        write_u32(p, fourcc(brand));
    }
    return ftyp;
}
