//
//  segment_plan.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "segment_plan.hpp"

#include <cmath>
#include <limits>
#include <string>

#include "timestamp_math.hpp"

namespace clipsplice {

namespace {

// Longest segment length accepted, in seconds (~292k years in microseconds).
constexpr double kMaxSegmentSeconds = 9.0e12;

}  // namespace

SpliceStatus SegmentPlan::create(double segment_seconds, uint64_t duration, uint64_t timescale,
                                 SegmentPlan &plan) {
    if (!std::isfinite(segment_seconds) || segment_seconds <= 0.0) {
        return SpliceStatus::failure(SpliceError::InvalidArgument,
                                     "segment duration must be a positive number of seconds");
    }
    if (segment_seconds > kMaxSegmentSeconds) {
        return SpliceStatus::failure(SpliceError::InvalidArgument, "segment duration too large");
    }
    const auto segment_us =
        static_cast<uint64_t>(std::llround(segment_seconds * static_cast<double>(kMicrosPerSecond)));
    if (segment_us == 0) {
        return SpliceStatus::failure(SpliceError::InvalidArgument,
                                     "segment duration below one microsecond");
    }
    if (timescale == 0 || duration == 0) {
        return SpliceStatus::failure(SpliceError::InvalidDuration,
                                     "source reports a non-positive duration");
    }

    // ceil(duration / timescale / d) == ceil(duration * 1e6 / (timescale * segment_us))
    uint64_t numerator = 0;
    uint64_t denominator = 0;
    if (!checked_mul(duration, kMicrosPerSecond, numerator) ||
        !checked_mul(timescale, segment_us, denominator)) {
        return SpliceStatus::failure(SpliceError::InvalidDuration,
                                     "source duration of " + std::to_string(duration) +
                                         " ticks is not representable");
    }
    plan.segment_us_ = segment_us;
    plan.segment_count_ = numerator / denominator + (numerator % denominator ? 1 : 0);
    return SpliceStatus::success();
}

bool SegmentPlan::segment_index(int64_t dts, uint64_t timescale, int64_t &index) const {
    if (timescale == 0) {
        return false;
    }
    uint64_t denominator = 0;
    if (!checked_mul(timescale, segment_us_, denominator)) {
        return false;
    }
    const uint64_t magnitude =
        dts < 0 ? static_cast<uint64_t>(-(dts + 1)) + 1 : static_cast<uint64_t>(dts);
    uint64_t numerator = 0;
    if (!checked_mul(magnitude, kMicrosPerSecond, numerator)) {
        return false;
    }
    if (dts >= 0) {
        index = static_cast<int64_t>(numerator / denominator);
    } else {
        // floor for negative timestamps
        index = -static_cast<int64_t>((numerator + denominator - 1) / denominator);
    }
    return true;
}

bool SegmentPlan::segment_start(uint64_t index, uint64_t timescale, int64_t &ticks) const {
    uint64_t scaled = 0;
    if (!checked_mul(index, segment_us_, scaled) || !checked_mul(scaled, timescale, scaled)) {
        return false;
    }
    const uint64_t start = scaled / kMicrosPerSecond;
    if (start > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    ticks = static_cast<int64_t>(start);
    return true;
}

}  // namespace clipsplice
