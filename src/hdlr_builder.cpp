//
//  hdlr_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "hdlr_builder.hpp"

std::unique_ptr<Atom> build_hdlr(uint32_t handler_type, const std::string &name) {
    auto h = Atom::create("hdlr");
    auto &p = h->payload;

    write_u8(p, 0);   // version
    write_u24(p, 0);  // flags

    write_u32(p, 0);  // pre_defined
    write_u32(p, handler_type);

    for (int i = 0; i < 3; ++i) {
        write_u32(p, 0);  // reserved
    }

    p.insert(p.end(), name.begin(), name.end());
    p.push_back(0);

    return h;
}
