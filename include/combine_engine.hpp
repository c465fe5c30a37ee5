//
//  combine_engine.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "container.hpp"
#include "splice_status.hpp"

namespace clipsplice {

struct CombineOptions {
    bool fast_start = true;  ///< moov ahead of mdat
};

struct CombineResult {
    SpliceStatus status;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Concatenate `sources` in order into one container.
 *
 * The first source fixes the track layout. Every later source must match it track by track
 * (count, media type, timescale), otherwise the call fails with FormatMismatch. Samples of
 * source `k` are shifted by the summed movie durations of sources `0..k-1`, converted to each
 * track's own timescale. A single source is returned unchanged without being parsed.
 *
 * Each source's samples are fully materialized before they are appended; memory use is bounded
 * by the largest single source plus the output.
 */
CombineResult run_combine(const std::vector<std::vector<uint8_t>> &sources,
                          const CombineOptions &options, const ContainerBackend &backend);

}  // namespace clipsplice
