//
//  trak_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <memory>

#include "media_types.hpp"
#include "mp4_atoms.hpp"

// Edit list starting the media after `empty_edit` movie ticks:
//   elst { (empty_edit, -1), (track_duration - empty_edit, 0) }
std::unique_ptr<Atom> build_edts(uint64_t empty_edit, uint64_t track_duration);

// Build a full track mirroring `track`:
//   trak
//     tkhd
//     edts (only when empty_edit > 0)
//     mdia
//       mdhd, hdlr
//       minf
//         vmhd | smhd | sthd | nmhd
//         dinf
//         stbl
// `media_duration` is in the media timescale; `empty_edit` and `track_duration` are in the
// movie timescale.
std::unique_ptr<Atom> build_trak(const clipsplice::TrackDescriptor &track, uint32_t track_id,
                                 uint64_t media_duration, uint64_t empty_edit,
                                 uint64_t track_duration, std::unique_ptr<Atom> stbl);
