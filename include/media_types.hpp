//
//  media_types.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace clipsplice {

enum class MediaType { Video, Audio, Text, Subtitle, Metadata, Other };

// Map an hdlr handler type onto a media type.
MediaType media_type_for_handler(uint32_t handler_type);
const char *media_type_name(MediaType type);

/**
 * @brief One elementary stream inside a container.
 *
 * `codec_config` is the complete `stsd` payload of the source track. It is treated as an
 * atomic, uninterpreted unit and must reach the destination byte-for-byte.
 */
struct TrackDescriptor {
    uint32_t track_id = 0;
    MediaType media_type = MediaType::Other;
    uint32_t handler_type = 0;
    std::string handler_name;

    uint64_t timescale = 0;     // media ticks per second
    uint64_t duration = 0;      // media timescale
    uint64_t sample_count = 0;
    uint16_t language = 0x55C4; // packed ISO-639-2, "und"
    int32_t min_composition_offset = 0;  // smallest cts - dts; negative only with signed ctts

    std::vector<uint8_t> codec_config;

    // Presentation fields carried over from tkhd.
    uint32_t tkhd_flags = 7;
    uint16_t layer = 0;
    uint16_t alternate_group = 0;
    uint16_t volume = 0;  // 8.8 fixed
    std::array<uint32_t, 9> matrix{0x00010000, 0, 0, 0, 0x00010000, 0, 0, 0, 0x40000000};
    uint32_t width = 0;   // 16.16 fixed
    uint32_t height = 0;  // 16.16 fixed
};

/**
 * @brief One access unit plus timing.
 *
 * A record always owns its payload. Anything that hands out records from a reused buffer
 * (see SampleSequence) expects the consumer to copy before keeping one.
 */
struct SampleRecord {
    int64_t dts = 0;
    int64_t cts = 0;
    uint32_t duration = 0;
    uint32_t size = 0;
    bool is_sync = true;
    std::vector<uint8_t> payload;
};

// Movie-level metadata of a parsed container.
struct ContainerInfo {
    uint64_t duration = 0;   // movie timescale
    uint64_t timescale = 0;  // movie ticks per second
    std::vector<TrackDescriptor> tracks;

    double duration_seconds() const {
        return timescale ? static_cast<double>(duration) / static_cast<double>(timescale) : 0.0;
    }
};

// Common delay for all tracks so that track `i` moves by at least `deficit[i]` of its own
// ticks. Entry `i` of the result is the shared movie-time lead in the timescale of
// `tracks[i]`, rounded up.
std::vector<uint64_t> composition_lead(const std::vector<TrackDescriptor> &tracks,
                                       const std::vector<uint64_t> &deficit,
                                       uint64_t movie_timescale);

// Per-track deficit implied by negative ctts offsets (see min_composition_offset).
std::vector<uint64_t> composition_deficit(const std::vector<TrackDescriptor> &tracks);

}  // namespace clipsplice
