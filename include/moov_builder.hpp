//
//  moov_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>
#include <vector>

#include "mp4_atoms.hpp"

// moov = mvhd + tracks in the given order. next_track_ID follows the highest track id.
std::unique_ptr<Atom> build_moov(uint32_t timescale, uint64_t duration,
                                 std::vector<std::unique_ptr<Atom>> traks);

// File type box: major brand isom, compatible isom/iso2/avc1/mp41.
std::unique_ptr<Atom> build_ftyp();
