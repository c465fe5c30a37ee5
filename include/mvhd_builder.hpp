//
//  mvhd_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>

#include "mp4_atoms.hpp"

// Movie header; switches to version 1 when the duration needs 64 bits.
std::unique_ptr<Atom> build_mvhd(uint32_t timescale, uint64_t duration, uint32_t next_track_id);
