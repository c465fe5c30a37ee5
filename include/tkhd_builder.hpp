//
//  tkhd_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>

#include "media_types.hpp"
#include "mp4_atoms.hpp"

// Track header mirroring the presentation fields of `track` (flags, layer, alternate group,
// volume, matrix, dimensions) under a new id. `duration` is in the movie timescale.
std::unique_ptr<Atom> build_tkhd(const clipsplice::TrackDescriptor &track, uint32_t track_id,
                                 uint64_t duration);
