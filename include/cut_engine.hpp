//
//  cut_engine.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "container.hpp"
#include "splice_status.hpp"

namespace clipsplice {

/// What happens to a sample whose timestamp maps outside `[0, segment_count)`.
enum class OutOfRangePolicy {
    Clamp,  ///< join the nearest valid segment (default)
    Drop,   ///< skip the sample
    Fail,   ///< abort with ExtractionFailure
};

const char *out_of_range_policy_name(OutOfRangePolicy policy);

// Accepts "clamp", "drop" and "fail".
bool parse_out_of_range_policy(std::string_view name, OutOfRangePolicy &policy);

struct CutOptions {
    OutOfRangePolicy out_of_range = OutOfRangePolicy::Clamp;
    bool fast_start = true;  ///< moov ahead of mdat in every clip
};

/// One finished output container.
struct Clip {
    std::string name;  ///< clip_01, clip_02, ...
    uint64_t segment_index = 0;
    uint64_t sample_count = 0;
    std::vector<uint8_t> bytes;
};

struct CutResult {
    SpliceStatus status;
    std::vector<Clip> clips;  ///< ascending segment order, empty segments skipped
    uint64_t segment_count = 0;
    uint64_t clamped_samples = 0;
    uint64_t dropped_samples = 0;
};

// Name for the clip of `segment_index`: 1-based, zero-padded to at least two digits.
std::string clip_name(uint64_t segment_index);

// Single pass over every track of `source`, bucketing samples into fixed-length clips.
// `source` is never modified; the reader receives its own copy.
CutResult run_cut(const std::vector<uint8_t> &source, double segment_seconds,
                  const CutOptions &options, const ContainerBackend &backend);

}  // namespace clipsplice
