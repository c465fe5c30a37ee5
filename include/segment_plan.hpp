//
//  segment_plan.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

#include "splice_status.hpp"

namespace clipsplice {

/**
 * @brief Fixed-length segmentation of a movie timeline.
 *
 * Segment `i` covers `[i*d, (i+1)*d)` seconds. The length is held in whole microseconds and
 * every conversion to track ticks is exact 64-bit integer math; a conversion that would
 * overflow reports failure instead of wrapping.
 */
class SegmentPlan {
   public:
    // Build the plan for `segment_seconds` over a movie of `duration` ticks at `timescale`.
    // InvalidArgument for a non-positive, non-finite or sub-microsecond length,
    // InvalidDuration for an empty timeline.
    static SpliceStatus create(double segment_seconds, uint64_t duration, uint64_t timescale,
                               SegmentPlan &plan);

    uint64_t segment_count() const { return segment_count_; }
    uint64_t segment_us() const { return segment_us_; }

    // floor(dts / timescale / d); negative for negative timestamps. May be >= segment_count().
    bool segment_index(int64_t dts, uint64_t timescale, int64_t &index) const;

    // First tick of segment `index` in `timescale`, rounded down.
    bool segment_start(uint64_t index, uint64_t timescale, int64_t &ticks) const;

   private:
    uint64_t segment_us_ = 0;
    uint64_t segment_count_ = 0;
};

}  // namespace clipsplice
