//
//  media_header_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "media_header_builder.hpp"

using clipsplice::MediaType;

static std::unique_ptr<Atom> build_vmhd() {
    auto vmhd = Atom::create("vmhd");
    auto &p = vmhd->payload;

    write_u8(p, 0);
    write_u24(p, 1);  // flags = 1, required by QuickTime

    write_u16(p, 0);  // graphicsmode
    write_u16(p, 0);  // opcolor red
    write_u16(p, 0);  // opcolor green
    write_u16(p, 0);  // opcolor blue

    return vmhd;
}

static std::unique_ptr<Atom> build_smhd() {
    auto smhd = Atom::create("smhd");
    auto &p = smhd->payload;

    write_u8(p, 0);
    write_u24(p, 0);
    write_u16(p, 0);  // balance
    write_u16(p, 0);  // reserved

    return smhd;
}

// Full box without fields: sthd and nmhd.
static std::unique_ptr<Atom> build_empty_full_box(const char type[4]) {
    auto box = Atom::create(type);
    write_u8(box->payload, 0);
    write_u24(box->payload, 0);
    return box;
}

std::unique_ptr<Atom> build_media_header(MediaType type) {
    switch (type) {
        case MediaType::Video:
            return build_vmhd();
        case MediaType::Audio:
            return build_smhd();
        case MediaType::Subtitle:
            return build_empty_full_box("sthd");
        default:
            return build_empty_full_box("nmhd");
    }
}

std::unique_ptr<Atom> build_dinf() {
    auto url = Atom::create("url ");
    write_u8(url->payload, 0);
    write_u24(url->payload, 1);  // self-contained, no location string

    auto dref = Atom::create("dref");
    write_u8(dref->payload, 0);
    write_u24(dref->payload, 0);
    write_u32(dref->payload, 1);  // entry_count
    dref->add(std::move(url));

    auto dinf = Atom::create("dinf");
    dinf->add(std::move(dref));
    return dinf;
}
