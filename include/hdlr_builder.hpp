//
//  hdlr_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>
#include <string>

#include "mp4_atoms.hpp"

// Handler box carrying the source track's handler type ("vide", "soun", "text", "meta", ...)
// and its name as a null-terminated string.
std::unique_ptr<Atom> build_hdlr(uint32_t handler_type, const std::string &name);
