//
//  media_header_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>

#include "media_types.hpp"
#include "mp4_atoms.hpp"

// Media information header matching the track kind:
//   Video     -> vmhd (flags = 1)
//   Audio     -> smhd
//   Subtitle  -> sthd
//   otherwise -> nmhd
std::unique_ptr<Atom> build_media_header(clipsplice::MediaType type);

// Build the standard ISO 'dinf' container:
//   dinf
//     dref
//       url  (flags = 1, self-contained)
std::unique_ptr<Atom> build_dinf();
