//
//  timestamp_math.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

namespace clipsplice {

constexpr uint64_t kMicrosPerSecond = 1000000;

// a * b, false on overflow.
inline bool checked_mul(uint64_t a, uint64_t b, uint64_t &out) {
    return !__builtin_mul_overflow(a, b, &out);
}

// a + b, false on overflow.
inline bool checked_add(uint64_t a, uint64_t b, uint64_t &out) {
    return !__builtin_add_overflow(a, b, &out);
}

// Convert `value` ticks of timescale `from` into timescale `to`, rounding half up.
// Split into quotient and remainder so that only the remainder is multiplied.
inline uint64_t rescale_ticks(uint64_t value, uint64_t from, uint64_t to) {
    if (from == 0 || from == to) {
        return value;
    }
    const uint64_t whole = (value / from) * to;
    const uint64_t rest = value % from;
    return whole + (rest * to + from / 2) / from;
}

// As rescale_ticks, rounding up.
inline uint64_t rescale_ticks_up(uint64_t value, uint64_t from, uint64_t to) {
    if (from == 0 || from == to) {
        return value;
    }
    const uint64_t whole = (value / from) * to;
    const uint64_t rest = value % from;
    return whole + (rest * to + from - 1) / from;
}

}  // namespace clipsplice
